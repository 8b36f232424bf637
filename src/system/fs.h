#ifndef FS_H
#define FS_H

#include <string>

namespace fs {
    /**
     * Get the directory path where the current executable is located
     * @return The executable directory path, or empty string on error
     */
    std::string getExecutablePath();

    /**
     * Create a directory (and its parents) if it doesn't already exist
     * @param path The directory path to create
     * @return true if directory was created or already exists, false on error
     */
    bool createDirectoryIfNotExists(const std::string& path);

    /**
     * Create a file with the given content, truncating any previous one
     * @return true on success
     */
    bool writeFile(const std::string& filePath, const std::string& content = "");

    /**
     * Add owner/group/other execute permission (0755). Best-effort: failures
     * are logged at debug level and otherwise ignored.
     */
    void ensureExecutable(const std::string& filePath);

    /**
     * Move source over target, replacing any existing target. Falls back to
     * copy-then-rename beside the target when a plain rename cannot cross
     * filesystems, so target is either the old file or the complete new one.
     * @return true on success; source is gone afterwards
     */
    bool replaceFile(const std::string& source, const std::string& target);

    /**
     * A uniquely named directory under the system temp dir with a nested
     * working directory. The whole root is removed when the object goes away,
     * whichever way the owning scope is left.
     */
    class TempWorkspace {
    public:
        // Throws std::runtime_error if the directories cannot be created
        explicit TempWorkspace(const std::string& prefix, const std::string& workName = "w");
        ~TempWorkspace();

        TempWorkspace(const TempWorkspace&) = delete;
        TempWorkspace& operator=(const TempWorkspace&) = delete;

        const std::string& root() const { return rootDir; }
        const std::string& workDir() const { return workingDir; }

    private:
        std::string rootDir;
        std::string workingDir;
    };
}

#endif // FS_H
