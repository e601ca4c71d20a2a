#ifndef PARACOPY_PORT_H_H
#define PARACOPY_PORT_H_H

#if defined(PARACOPY_STATIC)
#define PARACOPY_PORT

// Windows: 动态库导出/导入
#elif defined(_WIN32) || defined(_WIN64)
#if defined(PARACOPY_EXPORTS)
#define PARACOPY_PORT __declspec(dllexport)
#else
#define PARACOPY_PORT __declspec(dllimport)
#endif

// 非 Windows: ELF 可见性
#else
#if defined(__GNUC__) || defined(__clang__)
#define PARACOPY_PORT __attribute__((visibility("default")))
#else
#define PARACOPY_PORT
#endif
#endif

#endif
