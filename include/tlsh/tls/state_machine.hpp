/// @file
/// @brief Client side TLS 1.2 handshake state machine.

#pragma once
#include <optional>
#include <string_view>
#include <vector>
#include <casket/nonstd/span.hpp>
#include <casket/utils/noncopyable.hpp>
#include <tlsh/tls/alert.hpp>
#include <tlsh/tls/handshake_reader.hpp>
#include <tlsh/tls/i_transport.hpp>
#include <tlsh/tls/msgs/handshake_message.hpp>
#include <tlsh/tls/record_layer.hpp>
#include <tlsh/tls/session_context.hpp>
#include <tlsh/tls/settings.hpp>

namespace tlsh::tls
{

/// @brief Client handshake states in the order they are passed.
enum class HandshakeState
{
    Start,
    ClientHelloSent,
    ServerHelloReceived,
    CertificateReceived,
    ServerKeyExchangeReceived,
    ServerHelloDoneReceived,
    ClientKeyExchangeSent,
    ChangeCipherSpecSent,
    FinishedSent,
    ServerChangeCipherSpecReceived,
    ServerFinishedReceived,
    Established,
    Closed,
    Aborted,
};

std::string_view toString(const HandshakeState state);

/// @brief TLS 1.2 client connection driven by an explicit state machine.
///
/// Any fatal error moves the machine to @ref HandshakeState::Aborted, sends the matching alert
/// when one applies, closes the transport and rethrows.
class StateMachine final : public casket::NonCopyable
{
public:
    /// @brief Constructor.
    ///
    /// @param[in] transport Connected transport.
    /// @param[in] settings Client settings, must outlive the state machine.
    StateMachine(ITransport& transport, const ClientSettings& settings);

    ~StateMachine() noexcept;

    /// @brief Runs the full handshake.
    ///
    /// @throws tls::Exception with the abort reason.
    void handshake();

    /// @brief Sends application data.
    void write(nonstd::span<const uint8_t> data);

    /// @brief Receives application data.
    ///
    /// @return Number of bytes copied into @p buffer, 0 when the peer sent close_notify.
    size_t read(nonstd::span<uint8_t> buffer);

    /// @brief Sends close_notify and closes the transport.
    void shutdown();

    /// @brief Closes the transport and wipes key material.
    void cancel() noexcept;

    HandshakeState getState() const noexcept
    {
        return state_;
    }

    /// @brief Gets the reason of the abort, Error::None if not aborted.
    Error getAbortReason() const noexcept
    {
        return abortReason_;
    }

    bool isEstablished() const noexcept
    {
        return state_ == HandshakeState::Established;
    }

    const SessionContext& getSession() const noexcept
    {
        return session_;
    }

    const RecordLayer& getRecordLayer() const noexcept
    {
        return recordLayer_;
    }

private:
    template <typename Func>
    decltype(auto) guard(Func&& func);

    void changeState(HandshakeState next);

    void abort(Error reason, std::string_view message);

    void sendAlert(const Alert& alert);

    void sendHandshake(const HandshakeMessage::MessageType& message);

    void sendClientHello();

    void sendClientFlight();

    void processRecord(const Record& record);

    void processAlert(const Alert& alert);

    void processChangeCipherSpec(nonstd::span<const uint8_t> payload);

    void processHandshakeMessage(nonstd::span<const uint8_t> rawMessage);

    void processServerHello(ServerHello& serverHello);

    void processCertificate(const Certificate& certificate);

    void processServerKeyExchange(const ServerKeyExchange& keyExchange);

    void processServerHelloDone();

    void processFinished(const Finished& finished);

    void computeVerifyData(Side side, nonstd::span<uint8_t> verifyData);

    void wipe() noexcept;

private:
    ITransport& transport_;
    const ClientSettings& settings_;
    RecordLayer recordLayer_;
    HandshakeReader handshakeReader_;
    SessionContext session_;
    HandshakeState state_;
    Error abortReason_;
    std::optional<CipherState> pendingReadState_;
    std::array<uint8_t, TLS_FINISHED_SIZE> expectedFinished_;
    std::vector<uint8_t> appData_;
    size_t appDataOffset_;
};

} // namespace tlsh::tls
