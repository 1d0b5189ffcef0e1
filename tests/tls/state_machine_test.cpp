#include <stdexcept>
#include <gtest/gtest.h>

#include <tlsh/crypto/asymm_key.hpp>
#include <tlsh/crypto/cert_manager.hpp>
#include <tlsh/crypto/cert_verifier.hpp>
#include <tlsh/crypto/group_params.hpp>
#include <tlsh/crypto/signature.hpp>

#include <tlsh/tls/exts/extended_master_secret.hpp>
#include <tlsh/tls/settings.hpp>
#include <tlsh/tls/state_machine.hpp>

#include "test_pki.hpp"
#include "test_server.hpp"

using namespace tlsh;
using namespace tlsh::crypto;
using namespace tlsh::tls;
using namespace tlsh::test;

namespace
{

template <typename Func>
Error CatchError(Func&& func)
{
    try
    {
        func();
    }
    catch (const Exception& e)
    {
        return e.error();
    }
    return Error::None;
}

std::string ReadAll(StateMachine& client, size_t expected)
{
    std::string result;
    std::vector<uint8_t> buffer(4096);
    while (result.size() < expected)
    {
        size_t n = client.read(buffer);
        if (n == 0)
        {
            break;
        }
        result.append(buffer.begin(), buffer.begin() + n);
    }
    return result;
}

/// @brief Transport whose reads fail with an exception outside the TLS error taxonomy.
class FailingReadTransport final : public ITransport
{
public:
    void write(nonstd::span<const uint8_t> data, std::error_code& ec) override
    {
        (void)ec;
        written_.insert(written_.end(), data.begin(), data.end());
    }

    size_t read(nonstd::span<uint8_t> buffer, std::chrono::milliseconds timeout, std::error_code& ec) override
    {
        (void)buffer;
        (void)timeout;
        (void)ec;
        throw std::logic_error("device failure");
    }

    void close() noexcept override
    {
        open_ = false;
    }

    bool isOpen() const noexcept override
    {
        return open_;
    }

    const std::vector<uint8_t>& written() const
    {
        return written_;
    }

private:
    std::vector<uint8_t> written_;
    bool open_{true};
};

} // namespace

class HandshakeTest : public testing::Test
{
public:
    static void SetUpTestSuite()
    {
        caKey_ = RsaAsymmKey::generate(2048).release();
        serverKey_ = RsaAsymmKey::generate(2048).release();
    }

    static void TearDownTestSuite()
    {
        EVP_PKEY_free(caKey_);
        EVP_PKEY_free(serverKey_);
    }

    void SetUp() override
    {
        ca_ = std::make_unique<TestAuthority>(AsymmKey::shallowCopy(caKey_));
        serverCert_ = ca_->sign("Test Server", "localhost", serverKey_);

        certManager_.addCA(ca_->getCert());
        verifier_ = std::make_unique<CertVerifier>(certManager_);

        settings_.setServerName("localhost");
        settings_.setReadTimeout(std::chrono::seconds(5));
        settings_.setCertVerifier(verifier_.get());
    }

protected:
    static Key* caKey_;
    static Key* serverKey_;

    std::unique_ptr<TestAuthority> ca_;
    X509CertPtr serverCert_;
    CertManager certManager_;
    std::unique_ptr<CertVerifier> verifier_;
    ClientSettings settings_;
};

Key* HandshakeTest::caKey_{nullptr};
Key* HandshakeTest::serverKey_{nullptr};

TEST_F(HandshakeTest, RsaAes128CbcSha)
{
    settings_.setCipherList("TLS_RSA_WITH_AES_128_CBC_SHA");

    auto [client, server] = MakeTransportPair();
    ScriptedServer peer(std::move(server), serverKey_, {serverCert_.get()});
    peer.start();

    StateMachine conn(*client, settings_);
    ASSERT_NO_THROW(conn.handshake());
    ASSERT_TRUE(conn.isEstablished());

    const auto& session = conn.getSession();
    ASSERT_NE(session.cipherSuite, nullptr);
    EXPECT_EQ(session.cipherSuite->id, 0x002F);
    EXPECT_EQ(session.version, ProtocolVersion::TLSv1_2);
    EXPECT_TRUE(session.extendedMasterSecret);
    EXPECT_TRUE(session.serverExtensions.has<ExtendedMasterSecret>());
    EXPECT_TRUE(session.serverExtensions.has<RenegotiationExtension>());
    EXPECT_TRUE(conn.getRecordLayer().isWriteEncrypted());
    EXPECT_TRUE(conn.getRecordLayer().isReadEncrypted());

    std::vector<uint8_t> masterSecret(session.masterSecret.begin(), session.masterSecret.end());

    std::string ping = "ping";
    ASSERT_NO_THROW(conn.write({reinterpret_cast<const uint8_t*>(ping.data()), ping.size()}));
    EXPECT_EQ(ReadAll(conn, ping.size()), ping);

    conn.shutdown();
    EXPECT_EQ(conn.getState(), HandshakeState::Closed);
    EXPECT_FALSE(client->isOpen());

    peer.join();
    EXPECT_TRUE(peer.handshakeDone());
    EXPECT_TRUE(peer.closeNotifyReceived());
    EXPECT_EQ(peer.received(), ping);
    EXPECT_EQ(peer.masterSecret(), masterSecret);
}

TEST_F(HandshakeTest, ClassicMasterSecretWhenServerIgnoresExtension)
{
    settings_.setCipherList("TLS_RSA_WITH_AES_128_CBC_SHA");

    ScriptedServerOptions options;
    options.extendedMasterSecret = false;

    auto [client, server] = MakeTransportPair();
    ScriptedServer peer(std::move(server), serverKey_, {serverCert_.get()}, options);
    peer.start();

    StateMachine conn(*client, settings_);
    ASSERT_NO_THROW(conn.handshake());
    EXPECT_FALSE(conn.getSession().extendedMasterSecret);
    EXPECT_FALSE(conn.getSession().serverExtensions.has<ExtendedMasterSecret>());

    std::vector<uint8_t> masterSecret(conn.getSession().masterSecret.begin(), conn.getSession().masterSecret.end());
    conn.shutdown();

    peer.join();
    EXPECT_TRUE(peer.handshakeDone());
    EXPECT_EQ(peer.masterSecret(), masterSecret);
}

TEST_F(HandshakeTest, PeerClosesWithoutCloseNotify)
{
    settings_.setCipherList("TLS_RSA_WITH_AES_128_CBC_SHA");

    ScriptedServerOptions options;
    options.closeAfterEcho = true;

    auto [client, server] = MakeTransportPair();
    ScriptedServer peer(std::move(server), serverKey_, {serverCert_.get()}, options);
    peer.start();

    StateMachine conn(*client, settings_);
    ASSERT_NO_THROW(conn.handshake());

    std::string ping = "ping";
    conn.write({reinterpret_cast<const uint8_t*>(ping.data()), ping.size()});
    EXPECT_EQ(ReadAll(conn, ping.size()), ping);

    std::vector<uint8_t> buffer(16);
    EXPECT_EQ(CatchError([&] { conn.read(buffer); }), Error::ConnectionClosed);
    EXPECT_EQ(conn.getState(), HandshakeState::Aborted);
    EXPECT_EQ(conn.getAbortReason(), Error::ConnectionClosed);

    peer.join();
    EXPECT_FALSE(peer.closeNotifyReceived());
}

TEST_F(HandshakeTest, KeyLogLine)
{
    settings_.setCipherList("TLS_RSA_WITH_AES_128_GCM_SHA256");

    std::string keyLog;
    settings_.setKeyLogCallback([&keyLog](std::string_view line) { keyLog = std::string(line); });

    auto [client, server] = MakeTransportPair();
    ScriptedServer peer(std::move(server), serverKey_, {serverCert_.get()});
    peer.start();

    StateMachine conn(*client, settings_);
    ASSERT_NO_THROW(conn.handshake());

    ASSERT_EQ(keyLog.size(), std::string("CLIENT_RANDOM ").size() + 64 + 1 + 96);
    EXPECT_EQ(keyLog.compare(0, 14, "CLIENT_RANDOM "), 0);

    conn.shutdown();
    peer.join();
}

TEST_F(HandshakeTest, LargeApplicationDataIsFragmented)
{
    settings_.setCipherList("TLS_RSA_WITH_AES_256_GCM_SHA384");

    auto [client, server] = MakeTransportPair();
    ScriptedServer peer(std::move(server), serverKey_, {serverCert_.get()});
    peer.start();

    StateMachine conn(*client, settings_);
    ASSERT_NO_THROW(conn.handshake());

    const uint64_t writeSeq = conn.getRecordLayer().getSequenceNumbers().getWriteSequence();

    std::string data(40000, 'x');
    ASSERT_NO_THROW(conn.write({reinterpret_cast<const uint8_t*>(data.data()), data.size()}));
    EXPECT_EQ(conn.getRecordLayer().getSequenceNumbers().getWriteSequence(), writeSeq + 3);
    EXPECT_EQ(ReadAll(conn, data.size()), data);

    conn.shutdown();
    peer.join();
    EXPECT_EQ(peer.received(), data);
}

TEST_F(HandshakeTest, BadServerFinished)
{
    settings_.setCipherList("TLS_RSA_WITH_AES_128_CBC_SHA256");

    ScriptedServerOptions options;
    options.corruptFinished = true;

    auto [client, server] = MakeTransportPair();
    ScriptedServer peer(std::move(server), serverKey_, {serverCert_.get()}, options);
    peer.start();

    StateMachine conn(*client, settings_);
    EXPECT_EQ(CatchError([&] { conn.handshake(); }), Error::HandshakeVerificationFailed);
    EXPECT_EQ(conn.getState(), HandshakeState::Aborted);
    EXPECT_EQ(conn.getAbortReason(), Error::HandshakeVerificationFailed);
    EXPECT_FALSE(client->isOpen());

    peer.join();
}

TEST_F(HandshakeTest, UntrustedCertificate)
{
    settings_.setCipherList("TLS_RSA_WITH_AES_128_CBC_SHA");

    CertManager emptyManager;
    CertVerifier strictVerifier(emptyManager);
    settings_.setCertVerifier(&strictVerifier);

    auto [client, server] = MakeTransportPair();
    ScriptedServer peer(std::move(server), serverKey_, {serverCert_.get()});
    peer.start();

    StateMachine conn(*client, settings_);
    EXPECT_EQ(CatchError([&] { conn.handshake(); }), Error::UntrustedCertificate);
    EXPECT_EQ(conn.getState(), HandshakeState::Aborted);
    EXPECT_EQ(conn.getAbortReason(), Error::UntrustedCertificate);
    EXPECT_FALSE(client->isOpen());
    EXPECT_TRUE(conn.getSession().masterSecret.empty());
    EXPECT_FALSE(conn.getRecordLayer().isWriteEncrypted());

    peer.join();
    EXPECT_FALSE(peer.handshakeDone());
}

TEST_F(HandshakeTest, HostnameMismatch)
{
    settings_.setCipherList("TLS_RSA_WITH_AES_128_CBC_SHA");
    settings_.setServerName("www.example.com");

    auto [client, server] = MakeTransportPair();
    ScriptedServer peer(std::move(server), serverKey_, {serverCert_.get()});
    peer.start();

    StateMachine conn(*client, settings_);
    EXPECT_EQ(CatchError([&] { conn.handshake(); }), Error::UntrustedCertificate);
    EXPECT_FALSE(client->isOpen());

    peer.join();
}

TEST_F(HandshakeTest, CertificateKeyDoesNotMatchSuite)
{
    settings_.setCipherList("TLS_RSA_WITH_AES_128_CBC_SHA");

    auto ecKey = GroupParams::generateKeyByParams(GroupParams::SECP256R1);
    auto ecCert = ca_->sign("Test Server", "localhost", ecKey);

    auto [client, server] = MakeTransportPair();
    ScriptedServer peer(std::move(server), ecKey, {ecCert.get()});
    peer.start();

    StateMachine conn(*client, settings_);
    EXPECT_EQ(CatchError([&] { conn.handshake(); }), Error::UntrustedCertificate);

    peer.join();
}

class HandshakeFailureTest : public testing::Test
{
public:
    void SetUp() override
    {
        settings_.setCipherList("TLS_RSA_WITH_AES_128_CBC_SHA");
        settings_.setReadTimeout(std::chrono::milliseconds(200));
        settings_.setCertVerifier(&verifier_);

        std::tie(client_, server_) = MakeTransportPair();
    }

    void sendFromServer(const std::vector<uint8_t>& data)
    {
        std::error_code ec;
        server_->write(data, ec);
        ASSERT_FALSE(ec);
    }

    static ServerHello makeServerHello(uint16_t suite)
    {
        ServerHello serverHello;
        serverHello.version = ProtocolVersion::TLSv1_2;
        serverHello.random.fill(0x42);
        serverHello.cipherSuite = suite;
        return serverHello;
    }

    /// @brief Runs the handshake against the queued server data.
    Error runHandshake()
    {
        StateMachine conn(*client_, settings_);
        auto error = CatchError([&] { conn.handshake(); });
        EXPECT_EQ(conn.getState(), HandshakeState::Aborted);
        EXPECT_EQ(conn.getAbortReason(), error);
        return error;
    }

    /// @brief Records sent by the client, ClientHello first.
    std::vector<Record> clientRecords()
    {
        auto data = server_->drain();
        return ParseRecords(data);
    }

    void expectAlert(Alert::Description description)
    {
        auto records = clientRecords();
        ASSERT_EQ(records.size(), 2U);
        EXPECT_EQ(records[0].getType(), RecordType::Handshake);
        ASSERT_EQ(records[1].getType(), RecordType::Alert);

        Alert alert(records[1].getPayload());
        EXPECT_TRUE(alert.isFatal());
        EXPECT_EQ(alert.description(), description);
    }

    void expectNoAlert()
    {
        auto records = clientRecords();
        ASSERT_EQ(records.size(), 1U);
        EXPECT_EQ(records[0].getType(), RecordType::Handshake);
    }

protected:
    InsecureCertVerifier verifier_;
    ClientSettings settings_;
    std::unique_ptr<MemoryTransport> client_;
    std::unique_ptr<MemoryTransport> server_;
};

TEST_F(HandshakeFailureTest, ServerSelectsSuiteNotOffered)
{
    sendFromServer(MakeHandshakeRecord(makeServerHello(0x0035)));

    EXPECT_EQ(runHandshake(), Error::UnsupportedCipherSuite);
    EXPECT_FALSE(client_->isOpen());
    expectAlert(Alert::IllegalParameter);
}

TEST_F(HandshakeFailureTest, ServerSelectsUnknownSuite)
{
    sendFromServer(MakeHandshakeRecord(makeServerHello(0xC0FF)));

    EXPECT_EQ(runHandshake(), Error::UnsupportedCipherSuite);
    expectAlert(Alert::IllegalParameter);
}

TEST_F(HandshakeFailureTest, ServerSelectsOlderVersion)
{
    auto serverHello = makeServerHello(0x002F);
    serverHello.version = ProtocolVersion::TLSv1_1;
    sendFromServer(MakeHandshakeRecord(std::move(serverHello)));

    EXPECT_EQ(runHandshake(), Error::ProtocolVersionMismatch);
    expectAlert(Alert::ProtocolVersion);
}

TEST_F(HandshakeFailureTest, ServerSendsUnsolicitedExtension)
{
    settings_.setExtendedMasterSecret(false);

    auto serverHello = makeServerHello(0x002F);
    serverHello.extensions.add(std::make_unique<ExtendedMasterSecret>());
    sendFromServer(MakeHandshakeRecord(std::move(serverHello)));

    EXPECT_EQ(runHandshake(), Error::IllegalParameter);
    expectAlert(Alert::IllegalParameter);
}

TEST_F(HandshakeFailureTest, ServerSelectsCompression)
{
    // ServerHello body with compression method 1 and no extensions.
    std::vector<uint8_t> body = {0x03, 0x03};
    body.insert(body.end(), TLS_RANDOM_SIZE, 0x42);
    body.insert(body.end(), {0x00, 0x00, 0x2F, 0x01});

    std::vector<uint8_t> message = {0x02, 0x00, 0x00, static_cast<uint8_t>(body.size())};
    message.insert(message.end(), body.begin(), body.end());
    sendFromServer(MakeRecord(RecordType::Handshake, message));

    EXPECT_EQ(runHandshake(), Error::IllegalParameter);
    expectAlert(Alert::IllegalParameter);
}

TEST_F(HandshakeFailureTest, MalformedServerHello)
{
    std::vector<uint8_t> message = {0x02, 0x00, 0x00, 0x04, 0x03, 0x03, 0x00, 0x00};
    sendFromServer(MakeRecord(RecordType::Handshake, message));

    EXPECT_EQ(runHandshake(), Error::MalformedMessage);
    expectAlert(Alert::DecodeError);
}

TEST_F(HandshakeFailureTest, ServerHelloDoneBeforeServerHello)
{
    sendFromServer(MakeHandshakeRecord(ServerHelloDone()));

    EXPECT_EQ(runHandshake(), Error::UnexpectedMessage);
    expectAlert(Alert::UnexpectedMessage);
}

TEST_F(HandshakeFailureTest, MissingCertificate)
{
    sendFromServer(MakeHandshakeRecord(makeServerHello(0x002F)));
    sendFromServer(MakeHandshakeRecord(ServerHelloDone()));

    EXPECT_EQ(runHandshake(), Error::UnexpectedMessage);
    expectAlert(Alert::UnexpectedMessage);
}

TEST_F(HandshakeFailureTest, CertificateRequestIsRejected)
{
    sendFromServer(MakeHandshakeRecord(makeServerHello(0x002F)));
    std::vector<uint8_t> request = {0x0D, 0x00, 0x00, 0x04, 0x01, 0x01, 0x00, 0x00};
    sendFromServer(MakeRecord(RecordType::Handshake, request));

    EXPECT_EQ(runHandshake(), Error::UnexpectedMessage);
    expectAlert(Alert::UnexpectedMessage);
}

TEST_F(HandshakeFailureTest, ApplicationDataBeforeHandshake)
{
    std::vector<uint8_t> data = {0x01, 0x02, 0x03};
    sendFromServer(MakeRecord(RecordType::ApplicationData, data));

    EXPECT_EQ(runHandshake(), Error::UnexpectedMessage);
    expectAlert(Alert::UnexpectedMessage);
}

TEST_F(HandshakeFailureTest, ChangeCipherSpecBeforeFinishedSent)
{
    std::vector<uint8_t> ccs = {ChangeCipherSpec::Value};
    sendFromServer(MakeRecord(RecordType::ChangeCipherSpec, ccs));

    EXPECT_EQ(runHandshake(), Error::UnexpectedMessage);
    expectAlert(Alert::UnexpectedMessage);
}

TEST_F(HandshakeFailureTest, FatalAlertFromServer)
{
    std::vector<uint8_t> alert = {0x02, Alert::HandshakeFailure};
    sendFromServer(MakeRecord(RecordType::Alert, alert));

    EXPECT_EQ(runHandshake(), Error::AlertReceived);
    expectNoAlert();
}

TEST_F(HandshakeFailureTest, CloseNotifyDuringHandshake)
{
    std::vector<uint8_t> alert = {0x01, Alert::CloseNotify};
    sendFromServer(MakeRecord(RecordType::Alert, alert));

    EXPECT_EQ(runHandshake(), Error::ConnectionClosed);
    expectNoAlert();
}

TEST_F(HandshakeFailureTest, Timeout)
{
    EXPECT_EQ(runHandshake(), Error::Timeout);
    EXPECT_FALSE(client_->isOpen());
    expectNoAlert();
}

TEST_F(HandshakeFailureTest, TruncatedRecord)
{
    sendFromServer({0x16, 0x03, 0x03, 0x00, 0x64, 0x02, 0x00, 0x00, 0x46, 0x03, 0x03});
    server_->shutdownWrite();

    EXPECT_EQ(runHandshake(), Error::TruncatedRecord);
    EXPECT_FALSE(client_->isOpen());
}

TEST_F(HandshakeFailureTest, PeerClosesBeforeServerHello)
{
    server_->shutdownWrite();

    EXPECT_EQ(runHandshake(), Error::ConnectionClosed);
    expectNoAlert();
}

TEST_F(HandshakeFailureTest, PlaintextRecordTooLarge)
{
    sendFromServer({0x16, 0x03, 0x03, 0x40, 0x01});

    EXPECT_EQ(runHandshake(), Error::RecordTooLarge);
    expectAlert(Alert::RecordOverflow);
}

TEST_F(HandshakeFailureTest, HandshakeMessageTooLarge)
{
    settings_.setMaxHandshakeMessageSize(1024);
    sendFromServer(MakeRecord(RecordType::Handshake, std::vector<uint8_t>{0x0B, 0x00, 0x10, 0x00}));

    EXPECT_EQ(runHandshake(), Error::RecordTooLarge);
    expectAlert(Alert::RecordOverflow);
}

TEST_F(HandshakeFailureTest, Cancel)
{
    StateMachine conn(*client_, settings_);
    conn.cancel();

    EXPECT_EQ(conn.getState(), HandshakeState::Aborted);
    EXPECT_EQ(conn.getAbortReason(), Error::Cancelled);
    EXPECT_FALSE(client_->isOpen());
}

class EcdheFailureTest : public HandshakeFailureTest
{
public:
    static void SetUpTestSuite()
    {
        ecKey_ = GroupParams::generateKeyByParams(GroupParams::SECP256R1).release();
        rsaKey_ = RsaAsymmKey::generate(2048).release();
    }

    static void TearDownTestSuite()
    {
        EVP_PKEY_free(ecKey_);
        EVP_PKEY_free(rsaKey_);
    }

    void SetUp() override
    {
        HandshakeFailureTest::SetUp();
        settings_.setCipherList("TLS_ECDHE_ECDSA_WITH_AES_128_GCM_SHA256");
    }

    /// @brief Queues ServerHello and Certificate for @p suite.
    void sendServerHelloAndCertificate(uint16_t suite, Key* serverKey)
    {
        TestAuthority ca(AsymmKey::shallowCopy(serverKey));

        Certificate certificate;
        certificate.certs.push_back(Cert::toBuffer(ca.getCert()));

        sendFromServer(MakeHandshakeRecord(makeServerHello(suite)));
        sendFromServer(MakeHandshakeRecord(std::move(certificate)));
    }

    /// @brief Builds a signed ServerKeyExchange.
    ///
    /// The client random is unknown before the handshake runs, so the signature
    /// covers an all-zero client random and the server random of makeServerHello().
    static ServerKeyExchange makeServerKeyExchange(GroupParams group, SignatureScheme scheme, Key* signer)
    {
        auto ephemeralKey = GroupParams::generateKeyByParams(group);

        ServerKeyExchange keyExchange;
        keyExchange.group = group;
        keyExchange.publicPoint = AsymmKey::getEncodedPublicKey(ephemeralKey);
        keyExchange.scheme = scheme;

        std::array<uint8_t, TLS_RANDOM_SIZE> clientRandom{};
        std::array<uint8_t, TLS_RANDOM_SIZE> serverRandom;
        serverRandom.fill(0x42);
        keyExchange.signature =
            Signature::sign(scheme, signer, keyExchange.getSignedContent(clientRandom, serverRandom));
        return keyExchange;
    }

protected:
    static Key* ecKey_;
    static Key* rsaKey_;
};

Key* EcdheFailureTest::ecKey_{nullptr};
Key* EcdheFailureTest::rsaKey_{nullptr};

TEST_F(EcdheFailureTest, BadServerKeyExchangeSignature)
{
    sendServerHelloAndCertificate(0xC02B, ecKey_);
    sendFromServer(MakeHandshakeRecord(
        makeServerKeyExchange(GroupParams::SECP256R1, SignatureScheme::ECDSA_SHA256, ecKey_)));
    sendFromServer(MakeHandshakeRecord(ServerHelloDone()));

    EXPECT_EQ(runHandshake(), Error::HandshakeVerificationFailed);
    expectAlert(Alert::DecryptError);
}

TEST_F(EcdheFailureTest, GroupNotOffered)
{
    settings_.setGroups({GroupParams::SECP256R1});

    sendServerHelloAndCertificate(0xC02B, ecKey_);
    sendFromServer(MakeHandshakeRecord(
        makeServerKeyExchange(GroupParams::SECP384R1, SignatureScheme::ECDSA_SHA256, ecKey_)));

    EXPECT_EQ(runHandshake(), Error::IllegalParameter);
    expectAlert(Alert::IllegalParameter);
}

TEST_F(EcdheFailureTest, SignatureSchemeDoesNotMatchSuite)
{
    auto keyExchange = makeServerKeyExchange(GroupParams::SECP256R1, SignatureScheme::ECDSA_SHA256, ecKey_);
    keyExchange.scheme = SignatureScheme::RSA_PSS_RSAE_SHA256;

    sendServerHelloAndCertificate(0xC02B, ecKey_);
    sendFromServer(MakeHandshakeRecord(std::move(keyExchange)));

    EXPECT_EQ(runHandshake(), Error::IllegalParameter);
    expectAlert(Alert::IllegalParameter);
}

TEST_F(EcdheFailureTest, ServerKeyExchangeWithRsaKeyExchange)
{
    settings_.setCipherList("TLS_RSA_WITH_AES_128_CBC_SHA");

    sendServerHelloAndCertificate(0x002F, rsaKey_);
    sendFromServer(MakeHandshakeRecord(
        makeServerKeyExchange(GroupParams::SECP256R1, SignatureScheme::RSA_PKCS1_SHA256, rsaKey_)));

    EXPECT_EQ(runHandshake(), Error::UnexpectedMessage);
    expectAlert(Alert::UnexpectedMessage);
}

TEST_F(EcdheFailureTest, MissingServerKeyExchange)
{
    sendServerHelloAndCertificate(0xC02B, ecKey_);
    sendFromServer(MakeHandshakeRecord(ServerHelloDone()));

    EXPECT_EQ(runHandshake(), Error::UnexpectedMessage);
    expectAlert(Alert::UnexpectedMessage);
}

TEST(StateMachineTest, VerifierIsRequired)
{
    auto transports = MakeTransportPair();
    ClientSettings settings;
    EXPECT_ANY_THROW(StateMachine conn(*transports.first, settings));
}

TEST(StateMachineTest, NonProtocolFailureIsInternalError)
{
    FailingReadTransport transport;
    InsecureCertVerifier verifier;
    ClientSettings settings;
    settings.setCertVerifier(&verifier);

    StateMachine conn(transport, settings);
    EXPECT_THROW(conn.handshake(), std::logic_error);
    EXPECT_EQ(conn.getState(), HandshakeState::Aborted);
    EXPECT_EQ(conn.getAbortReason(), Error::InternalError);
    EXPECT_FALSE(transport.isOpen());

    auto records = ParseRecords(transport.written());
    ASSERT_EQ(records.size(), 2U);
    ASSERT_EQ(records[1].getType(), RecordType::Alert);
    EXPECT_EQ(Alert(records[1].getPayload()).description(), Alert::InternalError);
}
