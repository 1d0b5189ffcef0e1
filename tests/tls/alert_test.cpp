#include <vector>
#include <gtest/gtest.h>
#include <tlsh/tls/alert.hpp>
#include <tlsh/tls/exception.hpp>

using namespace tlsh::tls;

TEST(AlertTest, DefaultConstructor) {
    Alert alert;
    ASSERT_FALSE(alert.isFatal());
    ASSERT_EQ(alert.description(), Alert::None);
    ASSERT_FALSE(alert.isValid());
}

TEST(AlertTest, ParameterizedConstructor) {
    Alert alert(Alert::HandshakeFailure, true);
    ASSERT_TRUE(alert.isFatal());
    ASSERT_EQ(alert.description(), Alert::HandshakeFailure);
    ASSERT_TRUE(alert.isValid());
}

TEST(AlertTest, Deserialize) {
    std::vector<uint8_t> data = {2, 42};
    Alert alert(data);
    ASSERT_TRUE(alert.isFatal());
    ASSERT_EQ(alert.description(), Alert::BadCertificate);
    ASSERT_EQ(alert.toString(), "bad_certificate");
}

TEST(AlertTest, InvalidAlertSize) {
    std::vector<uint8_t> data = {1, 0, 22};
    ASSERT_THROW(Alert _(data), Exception);
}

TEST(AlertTest, InvalidAlertLevel) {
    std::vector<uint8_t> data = {3, 0};
    try
    {
        Alert alert(data);
        FAIL() << "alert with level 3 accepted";
    }
    catch (const Exception& e)
    {
        ASSERT_EQ(e.error(), Error::MalformedMessage);
    }
}

TEST(AlertTest, Serialize) {
    Alert alert(Alert::CloseNotify, false);
    auto serialized = alert.serialize();
    ASSERT_EQ(serialized[0], 1);
    ASSERT_EQ(serialized[1], 0);

    Alert deserialized(serialized);
    ASSERT_EQ(alert.isFatal(), deserialized.isFatal());
    ASSERT_EQ(alert.description(), deserialized.description());
}

TEST(AlertTest, SerializeWithoutDescription) {
    Alert alert;
    ASSERT_ANY_THROW(alert.serialize());
}

TEST(AlertTest, UnknownDescriptionToString) {
    std::vector<uint8_t> data = {2, 200};
    Alert alert(data);
    ASSERT_EQ(alert.toString(), "unknown_alert_200");
}

TEST(AlertTest, FromError) {
    ASSERT_EQ(Alert::fromError(Error::MalformedMessage).description(), Alert::DecodeError);
    ASSERT_EQ(Alert::fromError(Error::UnexpectedMessage).description(), Alert::UnexpectedMessage);
    ASSERT_EQ(Alert::fromError(Error::UnsupportedCipherSuite).description(), Alert::IllegalParameter);
    ASSERT_EQ(Alert::fromError(Error::IllegalParameter).description(), Alert::IllegalParameter);
    ASSERT_EQ(Alert::fromError(Error::UntrustedCertificate).description(), Alert::BadCertificate);
    ASSERT_EQ(Alert::fromError(Error::HandshakeVerificationFailed).description(), Alert::DecryptError);
    ASSERT_EQ(Alert::fromError(Error::BadRecordMac).description(), Alert::BadRecordMac);
    ASSERT_EQ(Alert::fromError(Error::RecordTooLarge).description(), Alert::RecordOverflow);
    ASSERT_EQ(Alert::fromError(Error::ProtocolVersionMismatch).description(), Alert::ProtocolVersion);
    ASSERT_EQ(Alert::fromError(Error::TruncatedRecord).description(), Alert::InternalError);
    ASSERT_EQ(Alert::fromError(Error::InternalError).description(), Alert::InternalError);
    ASSERT_TRUE(Alert::fromError(Error::MalformedMessage).isFatal());
}

TEST(AlertTest, NoAlertForTransportErrors) {
    for (auto error : {Error::None, Error::IoError, Error::Timeout, Error::ConnectionClosed, Error::AlertReceived,
                       Error::Cancelled})
    {
        ASSERT_FALSE(Alert::fromError(error).isValid());
    }
}
