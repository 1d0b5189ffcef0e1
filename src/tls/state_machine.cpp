#include <algorithm>
#include <cstring>

#include <openssl/crypto.h>

#include <casket/log/log_manager.hpp>
#include <casket/utils/exception.hpp>
#include <casket/utils/format.hpp>

#include <tlsh/crypto/asymm_key.hpp>
#include <tlsh/crypto/cert.hpp>
#include <tlsh/crypto/exception.hpp>
#include <tlsh/crypto/rand.hpp>
#include <tlsh/crypto/signature.hpp>

#include <tlsh/tls/cipher_suite_manager.hpp>
#include <tlsh/tls/exception.hpp>
#include <tlsh/tls/state_machine.hpp>

namespace tlsh::tls
{

namespace
{

/// @brief Key exchange capabilities of a cipher suite family.
struct KeyExchangeOps
{
    KeyExchange kx;
    bool requiresServerKeyExchange;
    void (*processServerKeyExchange)(SessionContext&, const ClientSettings&, const ServerKeyExchange&);
    ClientKeyExchange (*createClientKeyExchange)(SessionContext&);
};

ClientKeyExchange RsaCreateClientKeyExchange(SessionContext& session)
{
    ThrowIfFalse(crypto::AsymmKey::isAlgorithm(session.serverKey, "RSA"), Error::UntrustedCertificate,
                 "server certificate key is not RSA");

    // RFC 5246 7.4.7.1: client_version followed by 46 random bytes.
    session.premasterSecret.resize(TLS_PREMASTER_SECRET_SIZE);
    session.premasterSecret[0] = ProtocolVersion(ProtocolVersion::TLSv1_2).majorVersion();
    session.premasterSecret[1] = ProtocolVersion(ProtocolVersion::TLSv1_2).minorVersion();
    crypto::Rand::generate(session.premasterSecret.data() + 2, TLS_PREMASTER_SECRET_SIZE - 2);

    ClientKeyExchange keyExchange;
    keyExchange.kx = KeyExchange::RSA;
    keyExchange.exchangeKeys.resize(crypto::AsymmKey::sizeInBytes(session.serverKey));

    size_t length = crypto::AsymmKey::encrypt(session.serverKey, session.premasterSecret, keyExchange.exchangeKeys);
    keyExchange.exchangeKeys.resize(length);

    return keyExchange;
}

void EcdheProcessServerKeyExchange(SessionContext& session, const ClientSettings& settings,
                                   const ServerKeyExchange& keyExchange)
{
    const auto& groups = settings.getGroups();
    ThrowIfTrue(std::find(groups.begin(), groups.end(), keyExchange.group) == groups.end(),
                Error::IllegalParameter, casket::format("server selected group {} which was not offered",
                                                        keyExchange.group.wireCode()));

    const auto& schemes = settings.getSignatureSchemes();
    ThrowIfTrue(std::find(schemes.begin(), schemes.end(), keyExchange.scheme) == schemes.end(),
                Error::IllegalParameter, casket::format("server used signature scheme {} which was not offered",
                                                        keyExchange.scheme.wireCode()));

    auto keyAlgorithm = keyExchange.scheme.getKeyAlgorithm();
    auto expected = session.cipherSuite->auth == Authentication::RSA ? "RSA" : "EC";
    ThrowIfTrue(keyAlgorithm != expected, Error::IllegalParameter,
                "signature scheme does not match the cipher suite authentication");

    auto signedContent = keyExchange.getSignedContent(session.clientRandom, session.serverRandom);
    ThrowIfFalse(crypto::Signature::verify(keyExchange.scheme, session.serverKey, signedContent,
                                           keyExchange.signature),
                 Error::HandshakeVerificationFailed, "bad ServerKeyExchange signature");

    try
    {
        session.serverEphemeralKey = crypto::GroupParams::decodePublicKey(keyExchange.group, keyExchange.publicPoint);
    }
    catch (const crypto::CryptoException& e)
    {
        throw Exception(MakeErrorCode(Error::IllegalParameter),
                        casket::format("invalid server public key: {}", e.what()));
    }

    session.group = keyExchange.group;

    casket::debug("Key exchange group: {}, signature scheme: {}", session.group.toString(),
                  keyExchange.scheme.toString());
}

ClientKeyExchange EcdheCreateClientKeyExchange(SessionContext& session)
{
    auto privateKey = crypto::GroupParams::generateKeyByParams(session.group);

    auto sharedSecret = crypto::GroupParams::deriveSecret(privateKey, session.serverEphemeralKey);
    session.premasterSecret.assign(sharedSecret);
    OPENSSL_cleanse(sharedSecret.data(), sharedSecret.size());

    ClientKeyExchange keyExchange;
    keyExchange.kx = KeyExchange::ECDHE;
    keyExchange.exchangeKeys = crypto::AsymmKey::getEncodedPublicKey(privateKey);

    return keyExchange;
}

// clang-format off
const KeyExchangeOps gKeyExchangeOps[] = {
    {KeyExchange::RSA,   false, nullptr,                         &RsaCreateClientKeyExchange},
    {KeyExchange::ECDHE, true,  &EcdheProcessServerKeyExchange,  &EcdheCreateClientKeyExchange},
};
// clang-format on

const KeyExchangeOps& GetKeyExchangeOps(const CipherSuite& suite)
{
    for (const auto& ops : gKeyExchangeOps)
    {
        if (ops.kx == suite.kx)
        {
            return ops;
        }
    }
    throw casket::RuntimeError("Unsupported key exchange");
}

struct Transition
{
    HandshakeState from;
    HandshakeType message;
    HandshakeState to;
};

// clang-format off
const Transition gTransitions[] = {
    {HandshakeState::ClientHelloSent,                HandshakeType::ServerHelloCode,       HandshakeState::ServerHelloReceived},
    {HandshakeState::ServerHelloReceived,            HandshakeType::CertificateCode,       HandshakeState::CertificateReceived},
    {HandshakeState::CertificateReceived,            HandshakeType::ServerKeyExchangeCode, HandshakeState::ServerKeyExchangeReceived},
    {HandshakeState::CertificateReceived,            HandshakeType::ServerHelloDoneCode,   HandshakeState::ServerHelloDoneReceived},
    {HandshakeState::ServerKeyExchangeReceived,      HandshakeType::ServerHelloDoneCode,   HandshakeState::ServerHelloDoneReceived},
    {HandshakeState::ServerChangeCipherSpecReceived, HandshakeType::FinishedCode,          HandshakeState::ServerFinishedReceived},
};
// clang-format on

HandshakeState NextState(HandshakeState state, HandshakeType message)
{
    for (const auto& transition : gTransitions)
    {
        if (transition.from == state && transition.message == message)
        {
            return transition.to;
        }
    }
    throw Exception(MakeErrorCode(Error::UnexpectedMessage),
                    casket::format("unexpected {} in state {}", toString(message), toString(state)));
}

} // namespace

std::string_view toString(const HandshakeState state)
{
    switch (state)
    {
    case HandshakeState::Start:
        return "Start";
    case HandshakeState::ClientHelloSent:
        return "ClientHelloSent";
    case HandshakeState::ServerHelloReceived:
        return "ServerHelloReceived";
    case HandshakeState::CertificateReceived:
        return "CertificateReceived";
    case HandshakeState::ServerKeyExchangeReceived:
        return "ServerKeyExchangeReceived";
    case HandshakeState::ServerHelloDoneReceived:
        return "ServerHelloDoneReceived";
    case HandshakeState::ClientKeyExchangeSent:
        return "ClientKeyExchangeSent";
    case HandshakeState::ChangeCipherSpecSent:
        return "ChangeCipherSpecSent";
    case HandshakeState::FinishedSent:
        return "FinishedSent";
    case HandshakeState::ServerChangeCipherSpecReceived:
        return "ServerChangeCipherSpecReceived";
    case HandshakeState::ServerFinishedReceived:
        return "ServerFinishedReceived";
    case HandshakeState::Established:
        return "Established";
    case HandshakeState::Closed:
        return "Closed";
    case HandshakeState::Aborted:
        return "Aborted";
    }
    return "Unknown";
}

StateMachine::StateMachine(ITransport& transport, const ClientSettings& settings)
    : transport_(transport)
    , settings_(settings)
    , recordLayer_(transport)
    , handshakeReader_(settings.getMaxHandshakeMessageSize())
    , state_(HandshakeState::Start)
    , abortReason_(Error::None)
    , expectedFinished_()
    , appDataOffset_(0)
{
    casket::ThrowIfFalse(settings_.getCertVerifier(), "Certificate verifier is not set");

    recordLayer_.setReadTimeout(settings_.getReadTimeout());
    recordLayer_.setMaxReadSize(settings_.getMaxReadSize());
}

StateMachine::~StateMachine() noexcept
{
    wipe();
}

template <typename Func>
decltype(auto) StateMachine::guard(Func&& func)
{
    try
    {
        return func();
    }
    catch (const Exception& e)
    {
        abort(e.error(), e.what());
        throw;
    }
    catch (const std::exception& e)
    {
        abort(Error::InternalError, e.what());
        throw;
    }
}

void StateMachine::handshake()
{
    casket::ThrowIfTrue(state_ != HandshakeState::Start, "Handshake has already been started");

    guard(
        [this]
        {
            sendClientHello();
            while (state_ != HandshakeState::Established)
            {
                processRecord(recordLayer_.receive());
            }
        });

    casket::info("Handshake completed: {}, {}", session_.version.toString(), session_.cipherSuite->name);
}

void StateMachine::write(nonstd::span<const uint8_t> data)
{
    casket::ThrowIfFalse(isEstablished(), "Connection is not established");

    guard([this, data] { recordLayer_.send(RecordType::ApplicationData, data); });
}

size_t StateMachine::read(nonstd::span<uint8_t> buffer)
{
    if (state_ == HandshakeState::Closed)
    {
        return 0;
    }
    casket::ThrowIfFalse(isEstablished(), "Connection is not established");

    return guard(
        [this, buffer]() -> size_t
        {
            while (appDataOffset_ == appData_.size() && state_ == HandshakeState::Established)
            {
                appData_.clear();
                appDataOffset_ = 0;
                processRecord(recordLayer_.receive());
            }

            if (state_ == HandshakeState::Closed)
            {
                return 0;
            }

            const size_t length = std::min(buffer.size(), appData_.size() - appDataOffset_);
            std::memcpy(buffer.data(), appData_.data() + appDataOffset_, length);
            appDataOffset_ += length;
            return length;
        });
}

void StateMachine::shutdown()
{
    if (isEstablished())
    {
        try
        {
            sendAlert(Alert(Alert::CloseNotify));
        }
        catch (const Exception& e)
        {
            casket::warning("Failed to send close_notify: {}", e.what());
        }
    }

    if (state_ != HandshakeState::Aborted)
    {
        changeState(HandshakeState::Closed);
    }

    transport_.close();
    wipe();
}

void StateMachine::cancel() noexcept
{
    transport_.close();
    wipe();

    state_ = HandshakeState::Aborted;
    abortReason_ = Error::Cancelled;
}

void StateMachine::changeState(HandshakeState next)
{
    casket::debug("State {} -> {}", toString(state_), toString(next));
    state_ = next;
}

void StateMachine::abort(Error reason, std::string_view message)
{
    casket::error("Connection aborted in state {}: {}", toString(state_), message);

    state_ = HandshakeState::Aborted;
    abortReason_ = reason;

    auto alert = Alert::fromError(reason);
    if (alert.isValid() && transport_.isOpen())
    {
        try
        {
            sendAlert(alert);
        }
        catch (const Exception& e)
        {
            casket::warning("Failed to send alert {}: {}", alert.toString(), e.what());
        }
    }

    transport_.close();
    wipe();
}

void StateMachine::wipe() noexcept
{
    recordLayer_.reset();
    handshakeReader_.reset();
    session_.reset();
    pendingReadState_.reset();
    OPENSSL_cleanse(expectedFinished_.data(), expectedFinished_.size());
    if (!appData_.empty())
    {
        OPENSSL_cleanse(appData_.data(), appData_.size());
    }
    appData_.clear();
    appDataOffset_ = 0;
}

void StateMachine::sendAlert(const Alert& alert)
{
    auto data = alert.serialize();
    recordLayer_.send(RecordType::Alert, data);
    casket::debug("Alert >>> {}", alert.toString());
}

void StateMachine::sendHandshake(const HandshakeMessage::MessageType& message)
{
    auto data = HandshakeMessage::serialize(message);
    session_.transcript.update(data);
    recordLayer_.send(RecordType::Handshake, data);

    casket::debug("Handshake >>> {} [{}]", toString(HandshakeMessage::getType(message)), data.size());
}

void StateMachine::sendClientHello()
{
    ClientHello clientHello;
    clientHello.version = ProtocolVersion::TLSv1_2;
    crypto::Rand::generate(clientHello.random);
    clientHello.compMethods = {0};

    for (const auto* suite : settings_.getCipherSuites())
    {
        clientHello.suites.push_back(suite->id);
    }

    auto& extensions = clientHello.extensions;
    if (!settings_.getServerName().empty())
    {
        extensions.add(std::make_unique<ServerNameIndicator>(settings_.getServerName()));
    }
    if (settings_.offersEphemeral())
    {
        extensions.add(std::make_unique<SupportedGroups>(settings_.getGroups()));
        extensions.add(std::make_unique<SupportedPointFormats>());
    }
    extensions.add(std::make_unique<SignatureAlgorithms>(settings_.getSignatureSchemes()));
    if (settings_.useExtendedMasterSecret())
    {
        extensions.add(std::make_unique<ExtendedMasterSecret>());
    }
    extensions.add(std::make_unique<RenegotiationExtension>());

    session_.clientRandom = clientHello.random;

    HandshakeMessage::MessageType message(std::move(clientHello));
    sendHandshake(message);

    session_.clientExtensions = std::move(std::get<ClientHello>(message).extensions);
    changeState(HandshakeState::ClientHelloSent);
}

void StateMachine::sendClientFlight()
{
    const auto& ops = GetKeyExchangeOps(*session_.cipherSuite);
    ThrowIfTrue(ops.requiresServerKeyExchange && !session_.serverEphemeralKey, Error::UnexpectedMessage,
                "ServerKeyExchange is missing");

    sendHandshake(ops.createClientKeyExchange(session_));
    changeState(HandshakeState::ClientKeyExchangeSent);

    session_.generateMasterSecret();
    if (settings_.getKeyLogCallback())
    {
        settings_.getKeyLogCallback()(session_.keyLogLine());
    }

    auto keys = session_.generateTrafficKeys();
    const auto& suite = *session_.cipherSuite;

    std::array<uint8_t, 1> ccs{ChangeCipherSpec::Value};
    recordLayer_.send(RecordType::ChangeCipherSpec, ccs);
    changeState(HandshakeState::ChangeCipherSpecSent);

    recordLayer_.enableWriteEncryption(
        CipherState::create(suite, session_.version, keys.clientEncKey, keys.clientIV, keys.clientMacKey));
    pendingReadState_ =
        CipherState::create(suite, session_.version, keys.serverEncKey, keys.serverIV, keys.serverMacKey);

    Finished finished;
    computeVerifyData(Side::Client, finished.verifyData);
    sendHandshake(finished);
    changeState(HandshakeState::FinishedSent);
}

void StateMachine::computeVerifyData(Side side, nonstd::span<uint8_t> verifyData)
{
    std::array<uint8_t, EVP_MAX_MD_SIZE> buffer;
    auto transcriptHash = session_.transcriptHash(buffer);
    computeFinishedVerifyData(session_.cipherSuite->prfDigest, session_.masterSecret, transcriptHash, side,
                              verifyData);
}

void StateMachine::processRecord(const Record& record)
{
    switch (record.getType())
    {
    case RecordType::Handshake:
    {
        handshakeReader_.append(record.getPayload());
        while (auto message = handshakeReader_.next())
        {
            processHandshakeMessage(*message);
        }
        break;
    }
    case RecordType::ChangeCipherSpec:
        processChangeCipherSpec(record.getPayload());
        break;
    case RecordType::Alert:
        processAlert(Alert(record.getPayload()));
        break;
    case RecordType::ApplicationData:
    {
        ThrowIfFalse(isEstablished(), Error::UnexpectedMessage, "application data before handshake completion");
        auto payload = record.getPayload();
        appData_.insert(appData_.end(), payload.begin(), payload.end());
        break;
    }
    default:
        throw Exception(MakeErrorCode(Error::UnexpectedMessage), "unexpected record type");
    }
}

void StateMachine::processAlert(const Alert& alert)
{
    casket::debug("Alert <<< {}", alert.toString());

    if (alert.description() == Alert::CloseNotify)
    {
        ThrowIfFalse(isEstablished(), Error::ConnectionClosed, "close_notify received during handshake");

        changeState(HandshakeState::Closed);
        try
        {
            sendAlert(Alert(Alert::CloseNotify));
        }
        catch (const Exception& e)
        {
            casket::warning("Failed to answer close_notify: {}", e.what());
        }
        transport_.close();
        wipe();
        return;
    }

    if (alert.isFatal())
    {
        throw Exception(MakeErrorCode(Error::AlertReceived), casket::format("fatal alert {}", alert.toString()));
    }

    casket::warning("Ignoring warning alert {}", alert.toString());
}

void StateMachine::processChangeCipherSpec(nonstd::span<const uint8_t> payload)
{
    ThrowIfTrue(state_ != HandshakeState::FinishedSent, Error::UnexpectedMessage,
                casket::format("unexpected ChangeCipherSpec in state {}", toString(state_)));
    ThrowIfFalse(handshakeReader_.empty(), Error::UnexpectedMessage,
                 "ChangeCipherSpec inside a fragmented handshake message");

    ChangeCipherSpec::deserialize(payload);

    recordLayer_.enableReadEncryption(std::move(*pendingReadState_));
    pendingReadState_.reset();

    changeState(HandshakeState::ServerChangeCipherSpecReceived);
}

void StateMachine::processHandshakeMessage(nonstd::span<const uint8_t> rawMessage)
{
    const auto type = static_cast<HandshakeType>(rawMessage[0]);
    casket::debug("Handshake <<< {} [{}]", toString(type), rawMessage.size());

    if (isEstablished())
    {
        ThrowIfTrue(type != HandshakeType::HelloRequestCode, Error::UnexpectedMessage,
                    casket::format("unexpected {} after handshake", toString(type)));

        HandshakeMessage::deserialize(rawMessage);
        sendAlert(Alert(Alert::NoRenegotiation));
        return;
    }

    const auto next = NextState(state_, type);
    auto message = HandshakeMessage::deserialize(rawMessage);

    if (type == HandshakeType::FinishedCode)
    {
        computeVerifyData(Side::Server, expectedFinished_);
    }
    session_.transcript.update(rawMessage);

    switch (type)
    {
    case HandshakeType::ServerHelloCode:
        processServerHello(std::get<ServerHello>(message.message));
        break;
    case HandshakeType::CertificateCode:
        processCertificate(std::get<Certificate>(message.message));
        break;
    case HandshakeType::ServerKeyExchangeCode:
        processServerKeyExchange(std::get<ServerKeyExchange>(message.message));
        break;
    case HandshakeType::ServerHelloDoneCode:
        processServerHelloDone();
        break;
    case HandshakeType::FinishedCode:
        processFinished(std::get<Finished>(message.message));
        break;
    default:
        break;
    }

    changeState(next);

    if (next == HandshakeState::ServerHelloDoneReceived)
    {
        sendClientFlight();
    }
    else if (next == HandshakeState::ServerFinishedReceived)
    {
        changeState(HandshakeState::Established);
    }
}

void StateMachine::processServerHello(ServerHello& serverHello)
{
    ThrowIfTrue(serverHello.version != ProtocolVersion::TLSv1_2, Error::ProtocolVersionMismatch,
                casket::format("server selected {}", serverHello.version.toString()));

    const auto* suite = CipherSuiteManager::getInstance().getCipherSuiteById(serverHello.cipherSuite);
    const auto& offered = settings_.getCipherSuites();
    ThrowIfTrue(suite == nullptr || std::find(offered.begin(), offered.end(), suite) == offered.end(),
                Error::UnsupportedCipherSuite,
                casket::format("server selected cipher suite {} which was not offered", serverHello.cipherSuite));

    const auto& extensions = serverHello.extensions;
    ThrowIfTrue(extensions.containsOtherThan(session_.clientExtensions.extensionTypes()), Error::IllegalParameter,
                "server sent an extension which was not offered");

    auto reneg = extensions.get<RenegotiationExtension>();
    ThrowIfTrue(reneg && !reneg->getRenegInfo().empty(), Error::IllegalParameter,
                "non-empty renegotiation_info in initial handshake");

    session_.version = serverHello.version;
    session_.cipherSuite = suite;
    session_.serverRandom = serverHello.random;
    session_.serverExtensions = std::move(serverHello.extensions);
    session_.extendedMasterSecret = session_.serverExtensions.has<ExtendedMasterSecret>();

    recordLayer_.setVersion(session_.version);

    casket::info("Negotiated {} with {}", session_.version.toString(), suite->name);
    casket::debug("Extended master secret: {}", session_.extendedMasterSecret ? "yes" : "no");
}

void StateMachine::processCertificate(const Certificate& certificate)
{
    crypto::X509CertPtr leaf;
    crypto::CertStack1Ptr intermediates(sk_X509_new_null());
    crypto::ThrowIfTrue(intermediates == nullptr);

    try
    {
        leaf = crypto::Cert::fromBuffer(certificate.certs.front());
        for (size_t i = 1; i < certificate.certs.size(); ++i)
        {
            auto cert = crypto::Cert::fromBuffer(certificate.certs[i]);
            crypto::ThrowIfFalse(0 < sk_X509_push(intermediates.get(), cert.get()));
            cert.release();
        }
    }
    catch (const crypto::CryptoException& e)
    {
        throw Exception(MakeErrorCode(Error::UntrustedCertificate),
                        casket::format("failed to decode server certificate: {}", e.what()));
    }

    casket::debug("Server certificate: {}", crypto::Cert::subjectName(leaf));

    auto ec = settings_.getCertVerifier()->verifyChain(leaf, intermediates, settings_.getServerName());
    ThrowIfTrue(bool(ec), Error::UntrustedCertificate,
                casket::format("certificate verification failed: {}", ec.message()));

    auto publicKey = crypto::Cert::publicKey(leaf);
    const char* algorithm = session_.cipherSuite->auth == Authentication::RSA ? "RSA" : "EC";
    ThrowIfFalse(crypto::AsymmKey::isAlgorithm(publicKey, algorithm), Error::UntrustedCertificate,
                 "certificate key does not match the cipher suite");

    session_.serverCert = std::move(leaf);
    session_.serverIntermediates = std::move(intermediates);
    session_.serverKey = std::move(publicKey);
}

void StateMachine::processServerKeyExchange(const ServerKeyExchange& keyExchange)
{
    const auto& ops = GetKeyExchangeOps(*session_.cipherSuite);
    ThrowIfTrue(ops.processServerKeyExchange == nullptr, Error::UnexpectedMessage,
                casket::format("ServerKeyExchange is not allowed for {}", session_.cipherSuite->name));

    ops.processServerKeyExchange(session_, settings_, keyExchange);
}

void StateMachine::processServerHelloDone()
{
    const auto& ops = GetKeyExchangeOps(*session_.cipherSuite);
    ThrowIfTrue(ops.requiresServerKeyExchange && state_ != HandshakeState::ServerKeyExchangeReceived,
                Error::UnexpectedMessage, "ServerHelloDone without ServerKeyExchange");
}

void StateMachine::processFinished(const Finished& finished)
{
    ThrowIfFalse(CRYPTO_memcmp(expectedFinished_.data(), finished.verifyData.data(), TLS_FINISHED_SIZE) == 0,
                 Error::HandshakeVerificationFailed, "bad server Finished verify data");
}

} // namespace tlsh::tls
