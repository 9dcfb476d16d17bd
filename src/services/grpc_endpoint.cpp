/**
 * @file grpc_endpoint.cpp
 * @brief GrpcEndpoint implementation.
 *
 * @copyright Copyright (c) 2024 CrossMesh Contributors
 * @license MIT License
 */

#include "crossmesh/services/grpc_endpoint.hpp"
#include "crossmesh/core/timing.hpp"
#include "crossmesh/utils/logger.hpp"
#include "crossmesh/utils/node_identity.hpp"

#include "crossmesh/proto/transport.grpc.pb.h"
#include "crossmesh/proto/transport.pb.h"

#include <thread>

namespace crossmesh {
namespace services {

using core::ErrorKind;
using core::MeshError;
using transport::StreamChunk;

namespace {

const char* const NODE_METADATA_KEY = "x-crossmesh-node";
const char* const CONNECTION_METADATA_KEY = "x-crossmesh-conn";
const char* const TARGET_METADATA_KEY = "x-crossmesh-target-node";

constexpr auto SERVE_POLL_INTERVAL = std::chrono::milliseconds(100);

std::chrono::system_clock::time_point deadlineAfter(std::chrono::milliseconds timeout) {
    return std::chrono::system_clock::now() + timeout;
}

std::string metadataValue(const grpc::ServerContext* context, const std::string& key) {
    const auto& metadata = context->client_metadata();
    auto it = metadata.find(key);
    if (it == metadata.end()) {
        return "";
    }
    return std::string(it->second.data(), it->second.size());
}

/**
 * Inbound half of a stream: chunks pushed by the gRPC reader, popped by
 * Stream::read().
 */
class ChunkQueue {
public:
    void push(std::string data) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            chunks_.push_back(std::move(data));
        }
        cv_.notify_all();
    }

    void finish() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            finished_ = true;
        }
        cv_.notify_all();
    }

    void abort() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            aborted_ = true;
        }
        cv_.notify_all();
    }

    bool pop(std::string& out, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        bool ready = cv_.wait_for(lock, timeout, [this] {
            return !chunks_.empty() || finished_ || aborted_;
        });
        if (!ready) {
            throw MeshError(ErrorKind::TIMEOUT, "stream read timed out");
        }
        if (!chunks_.empty()) {
            out = std::move(chunks_.front());
            chunks_.pop_front();
            return true;
        }
        if (aborted_) {
            throw MeshError(ErrorKind::CONNECTION_CLOSED, "stream aborted");
        }
        return false;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> chunks_;
    bool finished_ = false;
    bool aborted_ = false;
};

grpc::ChannelArguments channelArguments() {
    grpc::ChannelArguments args;
    args.SetInt(GRPC_ARG_KEEPALIVE_TIME_MS, 10000);
    args.SetInt(GRPC_ARG_KEEPALIVE_TIMEOUT_MS, 5000);
    args.SetInt(GRPC_ARG_KEEPALIVE_PERMIT_WITHOUT_CALLS, 1);
    // One subchannel per mesh connection so a path swap really changes the socket.
    args.SetInt(GRPC_ARG_USE_LOCAL_SUBCHANNEL_POOL, 1);
    args.SetMaxReceiveMessageSize(-1);
    return args;
}

/**
 * Open a channel to one address and prove the peer's identity over it.
 * Throws TIMEOUT when nothing answers, IDENTITY_MISMATCH when the wrong
 * node answers.
 */
std::shared_ptr<grpc::Channel> dialAndHandshake(const std::string& address,
                                                const transport::HandshakeRequest& request,
                                                std::chrono::milliseconds timeout) {
    auto channel = grpc::CreateCustomChannel(address, grpc::InsecureChannelCredentials(),
                                             channelArguments());
    auto deadline = deadlineAfter(timeout);
    if (!channel->WaitForConnected(deadline)) {
        throw MeshError(ErrorKind::TIMEOUT, "no answer from " + address);
    }

    auto stub = transport::MeshTransport::NewStub(channel);
    grpc::ClientContext context;
    context.set_deadline(deadline);
    context.AddMetadata(TARGET_METADATA_KEY, request.expected_node_id());

    transport::HandshakeResponse response;
    grpc::Status status = stub->Handshake(&context, request, &response);
    if (!status.ok()) {
        throw toMeshError(status, "handshake with " + address);
    }
    if (response.node_id() != request.expected_node_id()) {
        throw MeshError(ErrorKind::IDENTITY_MISMATCH,
                        "peer at " + address + " presented node " +
                        utils::shortNodeId(response.node_id()) + ", expected " +
                        utils::shortNodeId(request.expected_node_id()));
    }
    return channel;
}

// =============================================================================
// Client side
// =============================================================================

class ClientStream : public core::Stream {
public:
    ClientStream(const std::shared_ptr<grpc::Channel>& channel,
                 const std::string& localNode,
                 const std::string& connectionId,
                 std::chrono::milliseconds lifetime)
        : stub_(transport::MeshTransport::NewStub(channel))
    {
        context_.AddMetadata(NODE_METADATA_KEY, localNode);
        context_.AddMetadata(CONNECTION_METADATA_KEY, connectionId);
        context_.set_deadline(deadlineAfter(lifetime));
        rw_ = stub_->OpenStream(&context_);
        reader_ = std::thread([this] { readLoop(); });
    }

    ~ClientStream() override {
        close();
        if (reader_.joinable()) {
            reader_.join();
        }
    }

    void write(const std::string& data) override {
        std::lock_guard<std::mutex> lock(writeMutex_);
        if (writesDone_ || ended_ || closed_.load()) {
            throw MeshError(ErrorKind::CONNECTION_CLOSED, "stream is closed for writing");
        }
        StreamChunk chunk;
        chunk.set_data(data);
        if (!rw_->Write(chunk)) {
            throw MeshError(ErrorKind::CONNECTION_CLOSED, "peer ended the stream");
        }
    }

    bool read(std::string& out, std::chrono::milliseconds timeout) override {
        return inbound_.pop(out, timeout);
    }

    void finish() override {
        std::lock_guard<std::mutex> lock(writeMutex_);
        if (writesDone_ || ended_) {
            return;
        }
        writesDone_ = true;
        rw_->WritesDone();
    }

    void close() override {
        if (!closed_.exchange(true)) {
            context_.TryCancel();
            inbound_.abort();
        }
    }

private:
    void readLoop() {
        StreamChunk chunk;
        bool sawFin = false;
        while (rw_->Read(&chunk)) {
            if (!chunk.data().empty()) {
                inbound_.push(chunk.data());
            }
            if (chunk.fin()) {
                sawFin = true;
                inbound_.finish();
            }
        }

        grpc::Status status;
        {
            std::lock_guard<std::mutex> lock(writeMutex_);
            ended_ = true;
            status = rw_->Finish();
        }
        if (status.ok() || sawFin) {
            inbound_.finish();
        } else {
            LOG_DEBUG("GrpcEndpoint", "Stream ended with status {}: {}",
                      static_cast<int>(status.error_code()), status.error_message());
            inbound_.abort();
        }
    }

    std::unique_ptr<transport::MeshTransport::Stub> stub_;
    grpc::ClientContext context_;
    std::unique_ptr<grpc::ClientReaderWriter<StreamChunk, StreamChunk>> rw_;
    std::thread reader_;
    ChunkQueue inbound_;

    std::mutex writeMutex_;
    bool writesDone_ = false;
    bool ended_ = false;
    std::atomic<bool> closed_{false};
};

class ClientConnection : public core::Connection,
                         public std::enable_shared_from_this<ClientConnection> {
public:
    ClientConnection(const GrpcEndpointConfig& config,
                     transport::HandshakeRequest handshake,
                     std::shared_ptr<grpc::Channel> channel,
                     core::PathQuality quality,
                     std::vector<std::string> directAddresses)
        : config_(config)
        , handshake_(std::move(handshake))
        , channel_(std::move(channel))
        , quality_(quality)
        , directAddresses_(std::move(directAddresses))
    {}

    ~ClientConnection() override {
        close();
    }

    void startUpgradeLoop() {
        if (directAddresses_.empty() || quality_ == core::PathQuality::DIRECT) {
            return;
        }
        upgrader_ = std::thread([this] { upgradeLoop(); });
    }

    std::shared_ptr<core::Stream> openStream(std::chrono::milliseconds) override {
        std::shared_ptr<grpc::Channel> channel;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                throw MeshError(ErrorKind::CONNECTION_CLOSED, "connection is closed");
            }
            channel = channel_;
        }
        return std::make_shared<ClientStream>(channel, config_.node_id,
                                              handshake_.connection_id(),
                                              config_.stream_lifetime);
    }

    // Streams on a dialed connection are always opened by the dialer.
    std::shared_ptr<core::Stream> acceptStream(std::chrono::milliseconds timeout) override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return closed_; });
        if (closed_) {
            throw MeshError(ErrorKind::CONNECTION_CLOSED, "connection is closed");
        }
        return nullptr;
    }

    core::NodeId remoteNodeId() const override { return handshake_.expected_node_id(); }

    core::PathQuality quality() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return quality_;
    }

    void onPathChange(PathChangeCallback callback) override {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks_.push_back(std::move(callback));
    }

    void close() override {
        std::shared_ptr<grpc::Channel> channel;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            closed_ = true;
            channel = channel_;
        }
        cv_.notify_all();
        if (upgrader_.joinable()) {
            upgrader_.join();
        }
        sayGoodbye(channel);
    }

    bool isClosed() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    void upgradeLoop() {
        transport::HandshakeRequest request = handshake_;
        request.set_relayed(false);

        for (int attempt = 1; attempt <= config_.upgrade_attempts; ++attempt) {
            {
                std::unique_lock<std::mutex> lock(mutex_);
                if (cv_.wait_for(lock, config_.upgrade_interval, [this] { return closed_; })) {
                    return;
                }
            }

            for (const auto& address : directAddresses_) {
                std::shared_ptr<grpc::Channel> direct;
                try {
                    direct = dialAndHandshake(address, request, config_.upgrade_interval);
                } catch (const MeshError& e) {
                    LOG_TRACE("GrpcEndpoint", "Upgrade attempt {} to {} failed: {}",
                              attempt, address, e.what());
                    continue;
                }

                std::vector<PathChangeCallback> callbacks;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    if (closed_) {
                        return;
                    }
                    channel_ = direct;
                    quality_ = core::PathQuality::DIRECT;
                    callbacks = callbacks_;
                }
                LOG_INFO("GrpcEndpoint", "Connection to {} upgraded to direct path {}",
                         utils::shortNodeId(remoteNodeId()), address);
                for (const auto& callback : callbacks) {
                    callback(core::PathQuality::DIRECT);
                }
                return;
            }
        }
        LOG_DEBUG("GrpcEndpoint", "Connection to {} stays relayed after {} attempts",
                  utils::shortNodeId(remoteNodeId()), config_.upgrade_attempts);
    }

    void sayGoodbye(const std::shared_ptr<grpc::Channel>& channel) {
        auto stub = transport::MeshTransport::NewStub(channel);
        grpc::ClientContext context;
        context.set_deadline(deadlineAfter(std::chrono::milliseconds(1000)));
        transport::GoodbyeRequest request;
        request.set_connection_id(handshake_.connection_id());
        transport::GoodbyeResponse response;
        grpc::Status status = stub->Goodbye(&context, request, &response);
        if (!status.ok()) {
            LOG_DEBUG("GrpcEndpoint", "Goodbye to {} failed: {}",
                      utils::shortNodeId(remoteNodeId()), status.error_message());
        }
    }

    const GrpcEndpointConfig config_;
    const transport::HandshakeRequest handshake_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::shared_ptr<grpc::Channel> channel_;
    core::PathQuality quality_;
    std::vector<PathChangeCallback> callbacks_;
    bool closed_ = false;

    const std::vector<std::string> directAddresses_;
    std::thread upgrader_;
};

// =============================================================================
// Server side
// =============================================================================

/**
 * One OpenStream call seen from the handler. serve() runs on the gRPC
 * handler thread and returns only once both halves are done, so the
 * reader/writer stays valid for every write made through this object.
 */
class ServerStream : public core::Stream {
public:
    ServerStream(grpc::ServerContext* context,
                 grpc::ServerReaderWriter<StreamChunk, StreamChunk>* rw)
        : context_(context)
        , rw_(rw)
    {}

    void write(const std::string& data) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!alive_ || localFinished_ || closed_.load()) {
            throw MeshError(ErrorKind::CONNECTION_CLOSED, "stream is closed for writing");
        }
        StreamChunk chunk;
        chunk.set_data(data);
        if (!rw_->Write(chunk)) {
            throw MeshError(ErrorKind::CONNECTION_CLOSED, "peer ended the stream");
        }
    }

    bool read(std::string& out, std::chrono::milliseconds timeout) override {
        return inbound_.pop(out, timeout);
    }

    void finish() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!alive_ || localFinished_) {
                return;
            }
            StreamChunk chunk;
            chunk.set_fin(true);
            if (!rw_->Write(chunk)) {
                LOG_DEBUG("GrpcEndpoint", "Peer went away before end of stream");
            }
            localFinished_ = true;
        }
        cv_.notify_all();
    }

    void close() override {
        if (closed_.exchange(true)) {
            return;
        }
        inbound_.abort();
        {
            std::lock_guard<std::mutex> lock(contextMutex_);
            if (contextAlive_) {
                context_->TryCancel();
            }
        }
        cv_.notify_all();
    }

    grpc::Status serve() {
        StreamChunk chunk;
        while (rw_->Read(&chunk)) {
            if (!chunk.data().empty()) {
                inbound_.push(chunk.data());
            }
            if (chunk.fin()) {
                break;
            }
        }
        if (context_->IsCancelled()) {
            inbound_.abort();
        } else {
            inbound_.finish();
        }

        {
            std::unique_lock<std::mutex> lock(mutex_);
            while (!localFinished_ && !closed_.load() && !context_->IsCancelled()) {
                cv_.wait_for(lock, SERVE_POLL_INTERVAL);
            }
            std::lock_guard<std::mutex> contextLock(contextMutex_);
            alive_ = false;
            contextAlive_ = false;
        }

        if (closed_.load()) {
            return grpc::Status(grpc::StatusCode::CANCELLED, "stream closed by the receiver");
        }
        return grpc::Status::OK;
    }

private:
    grpc::ServerContext* context_;
    grpc::ServerReaderWriter<StreamChunk, StreamChunk>* rw_;
    ChunkQueue inbound_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool alive_ = true;
    bool localFinished_ = false;
    std::atomic<bool> closed_{false};

    std::mutex contextMutex_;
    bool contextAlive_ = true;
};

}  // namespace

/**
 * Accepted side of a client's logical connection: the streams it opens
 * with the same connection id.
 */
class ServerConnection : public core::Connection {
public:
    ServerConnection(core::NodeId peer, std::string connectionId, bool relayed,
                     std::chrono::milliseconds idleTimeout)
        : peer_(std::move(peer))
        , connectionId_(std::move(connectionId))
        , quality_(relayed ? core::PathQuality::RELAYED : core::PathQuality::DIRECT)
        , idleTimeout_(idleTimeout)
        , lastActivity_(std::chrono::steady_clock::now())
    {}

    bool enqueue(std::shared_ptr<core::Stream> stream) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            pending_.push_back(std::move(stream));
            lastActivity_ = std::chrono::steady_clock::now();
        }
        cv_.notify_all();
        return true;
    }

    void markDirect() {
        std::vector<PathChangeCallback> callbacks;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (quality_ == core::PathQuality::DIRECT) {
                return;
            }
            quality_ = core::PathQuality::DIRECT;
            lastActivity_ = std::chrono::steady_clock::now();
            callbacks = callbacks_;
        }
        for (const auto& callback : callbacks) {
            callback(core::PathQuality::DIRECT);
        }
    }

    std::shared_ptr<core::Stream> openStream(std::chrono::milliseconds) override {
        throw MeshError(ErrorKind::REFUSED, "streams are opened by the dialing side");
    }

    std::shared_ptr<core::Stream> acceptStream(std::chrono::milliseconds timeout) override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return closed_ || !pending_.empty(); });
        if (!pending_.empty()) {
            auto stream = pending_.front();
            pending_.pop_front();
            return stream;
        }
        if (!closed_ && std::chrono::steady_clock::now() - lastActivity_ > idleTimeout_) {
            LOG_DEBUG("GrpcEndpoint", "Inbound connection {} from {} idle, closing",
                      connectionId_, utils::shortNodeId(peer_));
            closed_ = true;
        }
        if (closed_) {
            throw MeshError(ErrorKind::CONNECTION_CLOSED, "connection is closed");
        }
        return nullptr;
    }

    core::NodeId remoteNodeId() const override { return peer_; }

    core::PathQuality quality() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return quality_;
    }

    void onPathChange(PathChangeCallback callback) override {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks_.push_back(std::move(callback));
    }

    void close() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool isClosed() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    const core::NodeId peer_;
    const std::string connectionId_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::shared_ptr<core::Stream>> pending_;
    std::vector<PathChangeCallback> callbacks_;
    core::PathQuality quality_;
    const std::chrono::milliseconds idleTimeout_;
    std::chrono::steady_clock::time_point lastActivity_;
    bool closed_ = false;
};

// =============================================================================
// MeshTransport service
// =============================================================================

class GrpcEndpoint::TransportService final : public transport::MeshTransport::Service {
public:
    explicit TransportService(GrpcEndpoint& owner)
        : owner_(owner)
    {}

    grpc::Status Handshake(grpc::ServerContext* /*context*/,
                           const transport::HandshakeRequest* request,
                           transport::HandshakeResponse* response) override {
        if (!utils::isValidNodeId(request->node_id()) || request->connection_id().empty()) {
            return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "malformed handshake");
        }
        if (!request->expected_node_id().empty() &&
            request->expected_node_id() != owner_.config_.node_id) {
            LOG_WARN("GrpcEndpoint", "Handshake from {} expected node {}, we are {}",
                     utils::shortNodeId(request->node_id()),
                     utils::shortNodeId(request->expected_node_id()),
                     utils::shortNodeId(owner_.config_.node_id));
            return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, "node identity mismatch");
        }

        bool created = false;
        auto connection = owner_.registerInbound(request->connection_id(), request->node_id(),
                                                 request->relayed(), created);
        if (!connection) {
            return grpc::Status(grpc::StatusCode::UNAVAILABLE, "connection unavailable");
        }
        if (!created && !request->relayed()) {
            connection->markDirect();
        }

        response->set_node_id(owner_.config_.node_id);
        response->set_cluster_id(owner_.config_.cluster_id);
        return grpc::Status::OK;
    }

    grpc::Status OpenStream(grpc::ServerContext* context,
                            grpc::ServerReaderWriter<StreamChunk, StreamChunk>* rw) override {
        std::string connectionId = metadataValue(context, CONNECTION_METADATA_KEY);
        auto connection = owner_.findInbound(connectionId);
        if (!connection || connection->remoteNodeId() != metadataValue(context, NODE_METADATA_KEY)) {
            return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION,
                                "stream on unknown connection");
        }

        auto stream = std::make_shared<ServerStream>(context, rw);
        if (!connection->enqueue(stream)) {
            return grpc::Status(grpc::StatusCode::UNAVAILABLE, "connection is closed");
        }
        return stream->serve();
    }

    grpc::Status Goodbye(grpc::ServerContext* /*context*/,
                         const transport::GoodbyeRequest* request,
                         transport::GoodbyeResponse* /*response*/) override {
        auto connection = owner_.findInbound(request->connection_id());
        if (connection) {
            connection->close();
            owner_.dropInbound(request->connection_id());
        }
        return grpc::Status::OK;
    }

private:
    GrpcEndpoint& owner_;
};

// =============================================================================
// GrpcEndpoint
// =============================================================================

MeshError toMeshError(const grpc::Status& status, const std::string& what) {
    std::string message = what + ": " + status.error_message();
    switch (status.error_code()) {
        case grpc::StatusCode::DEADLINE_EXCEEDED:
            return MeshError(ErrorKind::TIMEOUT, message);
        case grpc::StatusCode::UNAVAILABLE:
            return MeshError(ErrorKind::UNREACHABLE, message);
        case grpc::StatusCode::FAILED_PRECONDITION:
            return MeshError(ErrorKind::IDENTITY_MISMATCH, message);
        default:
            return MeshError(ErrorKind::CONNECTION_CLOSED, message);
    }
}

GrpcEndpoint::GrpcEndpoint(const GrpcEndpointConfig& config)
    : config_(config)
    , service_(std::make_unique<TransportService>(*this))
{
}

GrpcEndpoint::~GrpcEndpoint() {
    close();
}

bool GrpcEndpoint::start() {
    std::string listenAddress = config_.bind_address + ":" + std::to_string(config_.port);
    int selectedPort = 0;

    grpc::ServerBuilder builder;
    builder.AddListeningPort(listenAddress, grpc::InsecureServerCredentials(), &selectedPort);
    builder.RegisterService(service_.get());
    builder.SetMaxReceiveMessageSize(-1);

    server_ = builder.BuildAndStart();
    if (!server_ || selectedPort == 0) {
        LOG_ERROR("GrpcEndpoint", "Failed to start transport server on {}", listenAddress);
        server_.reset();
        return false;
    }

    boundPort_ = static_cast<uint16_t>(selectedPort);
    LOG_INFO("GrpcEndpoint", "Transport listening on {}:{} as node {}",
             config_.bind_address, boundPort_, utils::shortNodeId(config_.node_id));
    return true;
}

core::NodeAddr GrpcEndpoint::localAddr() const {
    core::NodeAddr addr;
    addr.node_id = config_.node_id;
    addr.relay_url = config_.relay_url;
    addr.direct_addresses = config_.advertise_addresses;
    if (addr.direct_addresses.empty() && boundPort_ != 0) {
        std::string host = config_.bind_address == "0.0.0.0" ? "127.0.0.1" : config_.bind_address;
        addr.direct_addresses.push_back(host + ":" + std::to_string(boundPort_));
    }
    return addr;
}

std::shared_ptr<core::Connection> GrpcEndpoint::connect(const core::NodeAddr& addr,
                                                        core::ConnectPath path,
                                                        std::chrono::milliseconds timeout) {
    if (closed_.load()) {
        throw MeshError(ErrorKind::CONNECTION_CLOSED, "endpoint is closed");
    }

    transport::HandshakeRequest request;
    request.set_node_id(config_.node_id);
    request.set_expected_node_id(addr.node_id);
    request.set_cluster_id(config_.cluster_id);
    request.set_connection_id(utils::generateNodeId().substr(0, 32));
    request.set_relayed(path == core::ConnectPath::RELAY);

    if (path == core::ConnectPath::RELAY) {
        if (!addr.hasRelay()) {
            throw MeshError(ErrorKind::UNREACHABLE, "no relay known for " +
                            utils::shortNodeId(addr.node_id));
        }
        auto channel = dialAndHandshake(addr.relay_url, request, timeout);
        auto connection = std::make_shared<ClientConnection>(
            config_, request, std::move(channel), core::PathQuality::RELAYED,
            addr.direct_addresses);
        connection->startUpgradeLoop();
        LOG_INFO("GrpcEndpoint", "Connected to {} via relay {}",
                 utils::shortNodeId(addr.node_id), addr.relay_url);
        return connection;
    }

    if (addr.direct_addresses.empty()) {
        throw MeshError(ErrorKind::UNREACHABLE, "no direct address for " +
                        utils::shortNodeId(addr.node_id));
    }

    core::Deadline deadline = core::Deadline::after(timeout);
    ErrorKind lastKind = ErrorKind::UNREACHABLE;
    std::string lastMessage;
    for (const auto& address : addr.direct_addresses) {
        if (deadline.expired()) {
            lastKind = ErrorKind::TIMEOUT;
            break;
        }
        try {
            auto channel = dialAndHandshake(address, request, deadline.remaining());
            LOG_INFO("GrpcEndpoint", "Connected to {} directly at {}",
                     utils::shortNodeId(addr.node_id), address);
            return std::make_shared<ClientConnection>(config_, request, std::move(channel),
                                                      core::PathQuality::DIRECT,
                                                      std::vector<std::string>{});
        } catch (const MeshError& e) {
            if (e.kind() == ErrorKind::IDENTITY_MISMATCH) {
                throw;
            }
            LOG_DEBUG("GrpcEndpoint", "Direct dial {} failed: {}", address, e.what());
            lastKind = e.kind();
            lastMessage = e.what();
        }
    }

    throw MeshError(lastKind, "direct path to " + utils::shortNodeId(addr.node_id) +
                    " failed" + (lastMessage.empty() ? "" : ": " + lastMessage));
}

std::shared_ptr<core::Connection> GrpcEndpoint::accept(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(acceptMutex_);
    acceptCv_.wait_for(lock, timeout, [this] { return closed_.load() || !acceptQueue_.empty(); });
    if (closed_.load()) {
        throw MeshError(ErrorKind::CONNECTION_CLOSED, "endpoint is closed");
    }
    if (acceptQueue_.empty()) {
        return nullptr;
    }
    auto connection = acceptQueue_.front();
    acceptQueue_.pop_front();
    return connection;
}

void GrpcEndpoint::close() {
    if (closed_.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(acceptMutex_);
        acceptQueue_.clear();
    }
    acceptCv_.notify_all();

    std::unordered_map<std::string, std::shared_ptr<ServerConnection>> inbound;
    {
        std::lock_guard<std::mutex> lock(inboundMutex_);
        inbound.swap(inbound_);
    }
    for (auto& entry : inbound) {
        entry.second->close();
    }

    if (server_) {
        server_->Shutdown(deadlineAfter(std::chrono::milliseconds(1000)));
        server_->Wait();
        server_.reset();
    }
    LOG_INFO("GrpcEndpoint", "Transport closed");
}

size_t GrpcEndpoint::inboundConnectionCount() const {
    std::lock_guard<std::mutex> lock(inboundMutex_);
    return inbound_.size();
}

std::shared_ptr<ServerConnection> GrpcEndpoint::registerInbound(const std::string& connectionId,
                                                                const core::NodeId& peer,
                                                                bool relayed,
                                                                bool& created) {
    created = false;
    std::shared_ptr<ServerConnection> connection;
    {
        std::lock_guard<std::mutex> lock(inboundMutex_);
        if (closed_.load()) {
            return nullptr;
        }
        for (auto it = inbound_.begin(); it != inbound_.end();) {
            if (it->second->isClosed()) {
                it = inbound_.erase(it);
            } else {
                ++it;
            }
        }

        auto it = inbound_.find(connectionId);
        if (it != inbound_.end()) {
            if (it->second->remoteNodeId() != peer) {
                return nullptr;
            }
            return it->second;
        }

        connection = std::make_shared<ServerConnection>(peer, connectionId, relayed,
                                                        config_.server_idle_timeout);
        inbound_[connectionId] = connection;
        created = true;
    }

    {
        std::lock_guard<std::mutex> lock(acceptMutex_);
        acceptQueue_.push_back(connection);
    }
    acceptCv_.notify_all();
    LOG_DEBUG("GrpcEndpoint", "Inbound connection {} from {} ({})", connectionId,
              utils::shortNodeId(peer), relayed ? "relayed" : "direct");
    return connection;
}

std::shared_ptr<ServerConnection> GrpcEndpoint::findInbound(const std::string& connectionId) const {
    std::lock_guard<std::mutex> lock(inboundMutex_);
    auto it = inbound_.find(connectionId);
    return it == inbound_.end() ? nullptr : it->second;
}

void GrpcEndpoint::dropInbound(const std::string& connectionId) {
    std::lock_guard<std::mutex> lock(inboundMutex_);
    inbound_.erase(connectionId);
}

}  // namespace services
}  // namespace crossmesh
