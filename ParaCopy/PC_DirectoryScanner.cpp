#include "PC_DirectoryScanner.h"
#include "PC_FileSystem.h"
#include "PC_Logger.h"

using namespace std;

namespace internal
{
    // 目录无法打开时返回 false，由调用方决定是否记为跳过
    static bool ScanRecursive(const string& sourceDir, const string& destinationDir, const string& relativeDir,
        PC_ScanResult& result)
    {
        vector<PC_DirEntry> entries;
        if (!PC_ListDirectory(sourceDir, entries))
        {
            return false;
        }

        for (size_t i = 0; i < entries.size(); i++)
        {
            const PC_DirEntry& entry = entries[i];
            const string relativePath = relativeDir.empty() ? entry.name : relativeDir + "/" + entry.name;
            const string sourcePath = PC_JoinPath(sourceDir, entry.name);
            const string destinationPath = PC_JoinPath(destinationDir, entry.name);

            switch (entry.type)
            {
            case PC_DirEntryType::RegularFile:
            {
                PC_FileTask task;
                task.sourcePath = sourcePath;
                task.destinationPath = destinationPath;
                task.relativePath = relativePath;
                task.fileSize = entry.size;
                result.totalBytes += entry.size;
                result.tasks.push_back(std::move(task));
                break;
            }
            case PC_DirEntryType::Directory:
                result.directories.push_back(relativePath);
                if (!ScanRecursive(sourcePath, destinationPath, relativePath, result))
                {
                    // 打开失败时子树未产生任何条目，末尾即为本目录
                    result.directories.pop_back();
                    PC_LOG_WARNING("Cannot open directory, skipped: " + sourcePath);
                    result.skippedEntries.push_back(relativePath);
                }
                break;
            case PC_DirEntryType::SymlinkToDirectory:
                PC_LOG_DEBUG("Symbolic link to directory not followed: " + sourcePath);
                result.skippedEntries.push_back(relativePath);
                break;
            default:
                PC_LOG_DEBUG("Special file skipped: " + sourcePath);
                result.skippedEntries.push_back(relativePath);
                break;
            }
        }
        return true;
    }
}

bool PC_ScanDirectory(const string& sourceRoot, const string& destinationRoot, PC_ScanResult& result)
{
    result = PC_ScanResult();

    if (!PC_IsDirectoryExists(sourceRoot) || !internal::ScanRecursive(sourceRoot, destinationRoot, string(), result))
    {
        result = PC_ScanResult();
        return false;
    }

    PC_LOG_DEBUG("Scanned " + sourceRoot + ": " + to_string(result.tasks.size()) + " files, " +
        to_string(result.directories.size()) + " directories, " + to_string(result.totalBytes) + " bytes, " +
        to_string(result.skippedEntries.size()) + " skipped");
    return true;
}
