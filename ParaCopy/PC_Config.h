#ifndef PARACOPY_CONFIG_H_H
#define PARACOPY_CONFIG_H_H

#include "ParaCopyPort.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>

// Linux 默认为 "$XDG_CONFIG_HOME/ParaCopy/config.kv"（回退 "$HOME/.config/ParaCopy/config.kv"），
// Windows 默认为 "%APPDATA%\ParaCopy\config.kv"
PARACOPY_PORT std::string GetPcConfigPath();

// 检查指定配置是否存在
PARACOPY_PORT bool IsExistsPcConfig(const std::string& keyUtf8);

// 读指定配置
PARACOPY_PORT bool GetPcConfig(const std::string& keyUtf8, std::string& valueUtf8);

// 写指定配置
PARACOPY_PORT bool SetPcConfig(const std::string& keyUtf8, const std::string& valueUtf8);

// 删除指定配置
PARACOPY_PORT bool DeletePcConfig(const std::string& keyUtf8);

// 枚举所有配置
PARACOPY_PORT std::unordered_map<std::string, std::string> GetAllPcConfig();

/*
    拷贝引擎的可持久化默认参数。
    CopyRequest 中对应字段为 0 时取这里的值。
*/
struct PARACOPY_PORT PC_CopySettings
{
    size_t workerCount;
    uint64_t blockSize;
    int statusIntervalMs;

    PC_CopySettings();
};

/**
 * @brief 读取 PC_DefaultThreadCount / PC_BlockSize / PC_StatusIntervalMs。
 *
 * @remarks 不存在或格式错误的值使用默认值，越界的值被钳制到允许范围。
 */
PARACOPY_PORT PC_CopySettings LoadCopySettings();

// 写回三项配置（写入前先钳制）
PARACOPY_PORT bool SaveCopySettings(const PC_CopySettings& settings);

// 把三个字段分别钳制到允许范围；0 视为“使用默认值”
PARACOPY_PORT PC_CopySettings ClampCopySettings(const PC_CopySettings& settings);

#endif
