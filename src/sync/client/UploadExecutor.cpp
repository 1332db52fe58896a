#include "sync/client/UploadExecutor.hpp"
#include "sync/tasks/Upload.hpp"
#include "sync/Errors.hpp"
#include "concurrency/ThreadPool.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <future>

using namespace cs::sync;
using namespace cs::sync::client;
using namespace cs::sync::model;
using namespace cs::storage;
using namespace cs::concurrency;
using namespace cs::logging;

UploadExecutor::UploadExecutor(std::shared_ptr<BlobTransport> transport, const unsigned int concurrency)
    : transport_(std::move(transport)), concurrency_(std::max(1u, concurrency)) {}

UploadReport UploadExecutor::run(const std::vector<SyncAction>& actions,
                                 const std::unordered_map<std::string, std::string>& contents) {
    struct ClearCancel {
        std::atomic<bool>& flag;
        ~ClearCancel() { flag.store(false); }
    } clear{cancelled_};

    std::vector<const SyncAction*> pending;
    for (const auto& a : actions) {
        if (!a.needsUpload()) continue;
        if (!contents.contains(a.filePath)) throw UploadFailure(a.filePath, "no local content for " + a.filePath);
        pending.push_back(&a);
    }

    if (pending.empty()) return {};
    return transfer(pending, contents);
}

UploadReport UploadExecutor::transfer(const std::vector<const SyncAction*>& pending,
                                      const std::unordered_map<std::string, std::string>& contents) {
    std::vector<std::shared_ptr<tasks::Upload>> uploads;
    std::vector<std::future<bool>> futures;
    uploads.reserve(pending.size());
    futures.reserve(pending.size());

    {
        ThreadPool pool(std::min<unsigned int>(concurrency_, pending.size()), "UploadExecutor");

        for (const auto* a : pending) {
            auto task = std::make_shared<tasks::Upload>(transport_, *a, contents.at(a->filePath), cancelled_);
            futures.push_back(task->getFuture().value());
            uploads.push_back(task);
            pool.submit(task);
        }

        // barrier: every transfer settles before the round moves on
        for (auto& f : futures) f.wait();
        pool.stop();
    }

    std::vector<bool> ok;
    ok.reserve(futures.size());
    for (auto& f : futures) ok.push_back(f.get());

    if (const auto it = std::find(ok.begin(), ok.end(), false); it != ok.end()) {
        const auto& u = *uploads[it - ok.begin()];
        LogRegistry::client()->warn("[UploadExecutor] {} of {} uploads failed, first: {} ({})",
                                    std::count(ok.begin(), ok.end(), false), uploads.size(), u.action.filePath, u.error);
        throw UploadFailure(u.action.filePath, "upload of " + u.action.filePath + " failed: " + u.error);
    }

    UploadReport report;
    report.files = uploads.size();
    for (const auto& u : uploads) {
        report.bytes += u->bytes.size();
        if (u->elapsed >= report.slowest) {
            report.slowest = u->elapsed;
            report.slowestPath = u->action.filePath;
        }
    }

    LogRegistry::client()->info("[UploadExecutor] Uploaded {} files ({} bytes), slowest {} in {} ms",
                                report.files, report.bytes, report.slowestPath, report.slowest.count());
    return report;
}
