#pragma once

#include "proto/evalbox.grpc.pb.h"
#include "src/server/sandbox.h"
#include "src/server/suite_runner.h"

#include <atomic>
#include <chrono>
#include <grpcpp/grpcpp.h>

namespace evalbox {

// gRPC front of the engine. Each admitted call runs on its own worker thread;
// calls beyond max_active are turned away with RESOURCE_EXHAUSTED.
class CodeEvaluatorServiceImpl final : public rpc::CodeEvaluator::CallbackService {
public:
    CodeEvaluatorServiceImpl(Sandbox& sandbox, SuiteRunner& runner, int max_active,
                             std::chrono::seconds max_timeout);

    grpc::ServerUnaryReactor* Execute(grpc::CallbackServerContext* context,
                                      const rpc::ExecuteRequest* request,
                                      rpc::ExecutionOutcome* response) override;

    grpc::ServerUnaryReactor* RunSuite(grpc::CallbackServerContext* context,
                                       const rpc::RunSuiteRequest* request,
                                       rpc::SuiteResult* response) override;

    int active() const { return active_executions_.load(); }

private:
    bool TryAdmit();

    Sandbox& sandbox_;
    SuiteRunner& runner_;
    const int max_active_;
    const std::chrono::seconds max_timeout_;
    std::atomic<int> active_executions_;
};

} // namespace evalbox
