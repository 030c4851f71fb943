#include "sidecar_service.hpp"
#include "event_channel.hpp"
#include "log_reader.hpp"
#include "utf8.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <grpcpp/grpcpp.h>

#include "sidecar.grpc.pb.h"

namespace sidecar {

namespace {

constexpr auto kSubscribePollInterval = std::chrono::milliseconds(100);
constexpr auto kShutdownGrace = std::chrono::seconds(1);

void to_proto(const NotificationEvent& event, Notification* out) {
    out->set_name(event.name());
    switch (event.kind) {
    case NotificationEvent::Kind::PortReady:
        out->mutable_port_ready()->set_port(event.port);
        break;
    case NotificationEvent::Kind::WorkerError:
        out->mutable_worker_error()->set_message(to_valid_utf8(event.message));
        break;
    case NotificationEvent::Kind::WorkerTerminated: {
        auto* terminated = out->mutable_worker_terminated();
        if (event.exit_code.has_value()) {
            terminated->set_code(*event.exit_code);
        }
        if (event.signal.has_value()) {
            terminated->set_signal(*event.signal);
        }
        break;
    }
    }
}

} // anonymous namespace

// ============================================================================
// SidecarHost gRPC Service Implementation
// ============================================================================

class SidecarHostServiceImpl final : public SidecarHost::Service {
public:
    SidecarHostServiceImpl(const EndpointRegistry& registry, EventRelay& relay, std::string log_dir)
        : registry_(registry), relay_(relay), log_dir_(std::move(log_dir)) {}

    grpc::Status GetSidecarPort(
        grpc::ServerContext* context,
        const GetSidecarPortRequest* request,
        GetSidecarPortResponse* response) override {

        try {
            response->set_port(get_sidecar_port(registry_));
        } catch (const PortNotAvailable& e) {
            return grpc::Status(grpc::StatusCode::UNAVAILABLE, e.what());
        }
        return grpc::Status::OK;
    }

    grpc::Status Subscribe(
        grpc::ServerContext* context,
        const SubscribeRequest* request,
        grpc::ServerWriter<Notification>* writer) override {

        // 监听者可能在 unsubscribe 之后仍被 emit 的快照调用一次，队列必须共享所有权
        auto queue = std::make_shared<EventChannel<NotificationEvent>>();
        auto id = relay_.subscribe([queue](const NotificationEvent& event) {
            queue->push(event);
        });
        std::cout << "[SidecarHostService] Subscriber " << id << " connected" << std::endl;

        while (!context->IsCancelled() && !stopping_.load()) {
            auto event = queue->pop_for(kSubscribePollInterval);
            if (!event) {
                continue;
            }
            Notification notification;
            to_proto(*event, &notification);
            if (!writer->Write(notification)) {
                break;
            }
        }

        relay_.unsubscribe(id);
        queue->close();
        std::cout << "[SidecarHostService] Subscriber " << id << " disconnected" << std::endl;
        return grpc::Status::OK;
    }

    grpc::Status GetLogContents(
        grpc::ServerContext* context,
        const GetLogContentsRequest* request,
        GetLogContentsResponse* response) override {

        response->set_contents(read_log_contents(log_dir_));
        return grpc::Status::OK;
    }

    void shutdown() { stopping_.store(true); }

private:
    const EndpointRegistry& registry_;
    EventRelay& relay_;
    std::string log_dir_;
    std::atomic<bool> stopping_{false};
};

// ============================================================================
// SidecarHostServer Implementation
// ============================================================================

SidecarHostServer::SidecarHostServer(std::string listen_address, const EndpointRegistry& registry,
                                     EventRelay& relay, std::string log_dir)
    : listen_address_(std::move(listen_address)),
      service_(std::make_unique<SidecarHostServiceImpl>(registry, relay, std::move(log_dir))) {}

SidecarHostServer::~SidecarHostServer() {
    stop();
}

void SidecarHostServer::start() {
    if (running_.load()) {
        return;
    }

    grpc::ServerBuilder builder;
    if (!listen_address_.empty()) {
        builder.AddListeningPort(listen_address_, grpc::InsecureServerCredentials(), &selected_port_);
    }
    builder.RegisterService(service_.get());

    server_ = builder.BuildAndStart();
    if (!server_) {
        throw std::runtime_error("Failed to start gRPC server on " + listen_address_);
    }
    running_.store(true);

    if (!listen_address_.empty()) {
        std::cout << "[SidecarHostServer] gRPC server listening on " << listen_address_
                  << " (port " << selected_port_ << ")" << std::endl;
    }
}

void SidecarHostServer::run() {
    start();
    server_->Wait();
}

void SidecarHostServer::stop() {
    if (running_.exchange(false)) {
        std::cout << "[SidecarHostServer] Stopping..." << std::endl;
        service_->shutdown();
        server_->Shutdown(std::chrono::system_clock::now() + kShutdownGrace);
    }
}

std::shared_ptr<grpc::Channel> SidecarHostServer::in_process_channel() {
    if (!server_) {
        throw std::runtime_error("gRPC server not started");
    }
    grpc::ChannelArguments args;
    return server_->InProcessChannel(args);
}

} // namespace sidecar
