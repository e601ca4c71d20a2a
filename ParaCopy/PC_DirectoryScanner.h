#ifndef PARACOPY_DIRECTORY_SCANNER_H_H
#define PARACOPY_DIRECTORY_SCANNER_H_H

#include "ParaCopyPort.h"
#include "PC_TaskQueue.h"
#include <cstdint>
#include <string>
#include <vector>

#pragma warning(push)
#pragma warning(disable : 4251)

struct PARACOPY_PORT PC_ScanResult
{
    std::vector<PC_FileTask> tasks;             // 扫描顺序
    uint64_t totalBytes = 0;
    std::vector<std::string> directories;       // 全部子目录的相对路径（父目录在前），用于镜像空目录
    std::vector<std::string> skippedEntries;    // 无法读取的目录、指向目录的符号链接、特殊文件（相对路径）
};

/**
 * @brief 一次性遍历 sourceRoot 整棵树，生成目录模式的全部拷贝任务。
 *
 * @param sourceRoot      源目录。
 * @param destinationRoot 目标根目录；任务的 destinationPath = destinationRoot + 相对路径。
 * @param result          输出，调用时会被清空。
 *
 * @return false 源根目录本身无法打开。
 *
 * @remarks
 * - 每个目录内按名称字节序访问，结果与平台的枚举顺序无关；
 * - 指向常规文件的符号链接按普通文件拷贝（内容为目标文件）；指向目录的符号链接不跟随，记入 skippedEntries；
 * - 只读，不创建任何目录；totalBytes 为 0 的判定由调用方完成。
 */
PARACOPY_PORT bool PC_ScanDirectory(const std::string& sourceRoot, const std::string& destinationRoot, PC_ScanResult& result);

#pragma warning(pop)

#endif
