#ifndef PARACOPY_COPY_ORCHESTRATOR_H_H
#define PARACOPY_COPY_ORCHESTRATOR_H_H

#include "ParaCopyPort.h"
#include "PC_CopyTypes.h"
#include "PC_CopyWorker.h"
#include "PC_ProgressAggregator.h"
#include "PC_RangePartitioner.h"
#include "PC_TaskQueue.h"
#include "PC_ThreadPool.h"
#include <memory>
#include <string>
#include <vector>

#pragma warning(push)
#pragma warning(disable : 4251)

/*
    PC_CopyOrchestrator：一次拷贝操作的入口。

    Start() 校验请求、判定模式、预先创建目标（文件模式预设文件大小，目录模式创建全部目录），
    然后在线程池上启动 N 个 worker 并立即返回；Wait() 阻塞到完成并返回结果。

    线程安全：Cancel / IsRunning / GetStatus 可在任意线程调用，但不能与 Start / Wait 并发；
    Start / Wait 应由同一个拥有者线程调用，且不能在 listener 回调中调用。
*/
class PARACOPY_PORT PC_CopyOrchestrator
{
public:
    PC_CopyOrchestrator();
    // 仍在拷贝时先取消再等待
    ~PC_CopyOrchestrator();

    PC_CopyOrchestrator(const PC_CopyOrchestrator&) = delete;
    PC_CopyOrchestrator& operator=(const PC_CopyOrchestrator&) = delete;

    /**
     * @brief 校验并启动一次拷贝，不等待完成。
     *
     * @param request  拷贝请求，数值字段为 0 时取配置默认值，随后钳制到允许范围。
     * @param listener 可为空；生命周期必须覆盖到 Wait() 返回。
     *
     * @throws PC_CopyError 任何 worker 启动之前检测到的错误：
     *         InvalidSource / InvalidDestination / EmptySource / IOFailure / InvalidArgument（已有拷贝在运行）。
     */
    void Start(const PC_CopyRequest& request, PC_CopyListener* listener = nullptr);

    // 触发协作式取消，worker 在下一个块读写前停止
    void Cancel();

    /**
     * @brief 阻塞直到 OnCopyFinished 已发出，并回收全部 worker 线程。可重复调用。
     *
     * @throws PC_CopyError(InvalidArgument) 尚未成功 Start 过。
     */
    PC_CopyResult Wait();

    bool IsRunning() const;

    // 未启动时返回全 0 的状态
    PC_CopyStatus GetStatus() const;

    PC_CopyMode GetMode() const;

    // 仅文件模式非空
    std::vector<PC_FileRange> GetRanges() const;

    // 应用默认值与钳制之后的请求
    PC_CopyRequest GetEffectiveRequest() const;

private:
    PC_CopyRequest ResolveRequest(const PC_CopyRequest& request) const;
    void PrepareFileMode(const std::string& targetPath, PC_CopyListener* listener);
    void PrepareFolderMode(const std::string& sourceCanonical, const std::string& targetPath, const std::string& targetCanonical,
        PC_CopyListener* listener);
    void Launch();
    void ReleaseRun();

    PC_CopyRequest effectiveRequest;
    PC_CopyMode mode;
    std::vector<PC_FileRange> ranges;
    std::string destinationPath;
    PC_CancellationToken token;

    // 析构顺序与声明顺序相反：先回收线程池，再销毁 worker、队列、聚合器
    std::unique_ptr<PC_ProgressAggregator> aggregator;
    std::unique_ptr<PC_TaskQueue> queue;
    std::vector<std::unique_ptr<PC_CopyWorker>> workers;
    std::unique_ptr<PC_ThreadPool> pool;
};

#pragma warning(pop)

#endif
