#include "src/server/service.h"
#include "src/server/conversions.h"
#include "src/server/logger.h"

#include <exception>
#include <functional>
#include <mutex>
#include <thread>

namespace evalbox {

using grpc::CallbackServerContext;
using grpc::ServerUnaryReactor;
using grpc::Status;
using grpc::StatusCode;

namespace {

class RejectReactor : public ServerUnaryReactor {
public:
    explicit RejectReactor(const Status& status) { Finish(status); }
    void OnDone() override { delete this; }
};

// Runs blocking engine work off the gRPC callback threads.
class WorkerReactor : public ServerUnaryReactor {
public:
    WorkerReactor(std::function<Status()> work, std::atomic<int>& counter) : counter_(counter) {
        std::lock_guard<std::mutex> lock(mutex_);
        worker_thread_ = std::thread([this, work = std::move(work)]() {
            Status status;
            try {
                status = work();
            } catch (const std::exception& e) {
                Logger::Error("Request failed: ", e.what());
                status = Status(StatusCode::INTERNAL, e.what());
            }
            counter_.fetch_sub(1);
            Finish(status);
        });
    }

    void OnDone() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (worker_thread_.joinable()) {
                if (worker_thread_.get_id() == std::this_thread::get_id()) {
                    worker_thread_.detach();
                } else {
                    worker_thread_.join();
                }
            }
        }
        delete this;
    }

    void OnCancel() override {
        // No mid-flight cancellation; the execution ends at its own deadline.
        Logger::Warn("RPC cancelled by client.");
    }

private:
    std::atomic<int>& counter_;
    std::mutex mutex_;
    std::thread worker_thread_;
};

} // namespace

CodeEvaluatorServiceImpl::CodeEvaluatorServiceImpl(Sandbox& sandbox, SuiteRunner& runner, int max_active,
                                                   std::chrono::seconds max_timeout)
    : sandbox_(sandbox), runner_(runner), max_active_(max_active), max_timeout_(max_timeout),
      active_executions_(0) {}

bool CodeEvaluatorServiceImpl::TryAdmit() {
    int active = active_executions_.fetch_add(1);
    if (active >= max_active_) {
        active_executions_.fetch_sub(1);
        Logger::Warn("Too many active executions (", active, "). Rejecting request.");
        return false;
    }
    Logger::Debug("Admitted request. Active executions: ", active + 1);
    return true;
}

ServerUnaryReactor* CodeEvaluatorServiceImpl::Execute(CallbackServerContext* context,
                                                      const rpc::ExecuteRequest* request,
                                                      rpc::ExecutionOutcome* response) {
    ExecutionRequest parsed;
    std::string error;
    if (!FromProto(*request, max_timeout_, &parsed, &error)) {
        Logger::Warn("Rejected Execute from ", context->peer(), ": ", error);
        return new RejectReactor(Status(StatusCode::INVALID_ARGUMENT, error));
    }
    if (!TryAdmit()) {
        return new RejectReactor(Status(StatusCode::RESOURCE_EXHAUSTED, "Too many active executions"));
    }

    Logger::Info("Received Execute request from ", context->peer());
    return new WorkerReactor(
        [this, parsed, response]() {
            ToProto(sandbox_.Execute(parsed), response);
            return Status::OK;
        },
        active_executions_);
}

ServerUnaryReactor* CodeEvaluatorServiceImpl::RunSuite(CallbackServerContext* context,
                                                       const rpc::RunSuiteRequest* request,
                                                       rpc::SuiteResult* response) {
    SuiteRequest parsed;
    std::string error;
    if (!FromProto(*request, &parsed, &error)) {
        Logger::Warn("Rejected RunSuite from ", context->peer(), ": ", error);
        return new RejectReactor(Status(StatusCode::INVALID_ARGUMENT, error));
    }
    if (!TryAdmit()) {
        return new RejectReactor(Status(StatusCode::RESOURCE_EXHAUSTED, "Too many active executions"));
    }

    Logger::Info("Received RunSuite request with ", parsed.test_cases.size(), " test case(s) from ",
                 context->peer());
    return new WorkerReactor(
        [this, parsed, response]() {
            ToProto(runner_.RunSuite(parsed.code, parsed.test_cases), response);
            return Status::OK;
        },
        active_executions_);
}

} // namespace evalbox
