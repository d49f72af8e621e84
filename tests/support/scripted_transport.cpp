#include "support/scripted_transport.hpp"
#include "ondd/ipc/errors.hpp"

namespace ondd::testing {

void TransportScript::respond(const std::string& response) {
    std::lock_guard<std::mutex> lock(mutex);
    responses.push_back(response);
}

std::vector<std::string> TransportScript::sent_requests() {
    std::lock_guard<std::mutex> lock(mutex);
    return sent;
}

ScriptedTransport::ScriptedTransport(std::shared_ptr<TransportScript> script)
    : script_(std::move(script)) {
}

void ScriptedTransport::open(const std::string& endpoint) {
    if (open_) {
        return;
    }

    std::lock_guard<std::mutex> lock(script_->mutex);
    if (script_->refuse_connections) {
        throw ipc::ConnectionError("connection refused");
    }
    endpoint_ = endpoint;
    script_->endpoints.push_back(endpoint);
    script_->opens++;
    open_ = true;
}

void ScriptedTransport::send(const std::string& bytes) {
    if (!open_) {
        throw ipc::ConnectionError("connection is closed");
    }

    std::lock_guard<std::mutex> lock(script_->mutex);
    script_->sent.push_back(bytes);
}

std::string ScriptedTransport::receive_response(std::chrono::milliseconds timeout) {
    if (!open_) {
        throw ipc::ConnectionError("connection is closed");
    }

    std::lock_guard<std::mutex> lock(script_->mutex);
    if (script_->responses.empty()) {
        open_ = false;
        script_->closes++;
        throw ipc::TimeoutError("no complete response within " + std::to_string(timeout.count()) + " ms");
    }

    auto response = script_->responses.front();
    script_->responses.pop_front();
    return response;
}

void ScriptedTransport::close() {
    if (!open_) {
        return;
    }

    std::lock_guard<std::mutex> lock(script_->mutex);
    script_->closes++;
    open_ = false;
}

void ScriptedTransport::cancel() {
    close();
}

ipc::ProtocolClient::TransportFactory ScriptedTransport::factory(std::shared_ptr<TransportScript> script) {
    return [script]() -> std::unique_ptr<ipc::Transport> {
        {
            std::lock_guard<std::mutex> lock(script->mutex);
            script->transports_created++;
        }
        return std::make_unique<ScriptedTransport>(script);
    };
}

}
