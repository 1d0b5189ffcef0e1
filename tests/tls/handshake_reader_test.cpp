#include <gtest/gtest.h>
#include <tlsh/tls/handshake_reader.hpp>
#include <tlsh/tls/exception.hpp>

using namespace tlsh::tls;

namespace
{

std::vector<uint8_t> MakeMessage(uint8_t type, size_t length, uint8_t fill)
{
    std::vector<uint8_t> message(TLS_HANDSHAKE_HEADER_SIZE + length, fill);
    message[0] = type;
    message[1] = static_cast<uint8_t>(length >> 16);
    message[2] = static_cast<uint8_t>(length >> 8);
    message[3] = static_cast<uint8_t>(length);
    return message;
}

} // namespace

TEST(HandshakeReaderTest, Empty)
{
    HandshakeReader reader;
    ASSERT_TRUE(reader.empty());
    ASSERT_FALSE(reader.next().has_value());
}

TEST(HandshakeReaderTest, FragmentedMessage)
{
    HandshakeReader reader;
    auto message = MakeMessage(0x0B, 3000, 0xAA);

    nonstd::span<const uint8_t> data(message);
    reader.append(data.first(2));
    ASSERT_FALSE(reader.next().has_value());

    reader.append(data.subspan(2, 1000));
    ASSERT_FALSE(reader.next().has_value());

    reader.append(data.subspan(1002));
    auto result = reader.next();
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(*result, message);
    ASSERT_TRUE(reader.empty());
}

TEST(HandshakeReaderTest, CoalescedMessages)
{
    HandshakeReader reader;
    auto first = MakeMessage(0x02, 70, 0x01);
    auto second = MakeMessage(0x0B, 10, 0x02);
    auto third = MakeMessage(0x0E, 0, 0x00);

    std::vector<uint8_t> record;
    record.insert(record.end(), first.begin(), first.end());
    record.insert(record.end(), second.begin(), second.end());
    record.insert(record.end(), third.begin(), third.end());
    record.insert(record.end(), {0x14, 0x00});

    reader.append(record);
    ASSERT_EQ(*reader.next(), first);
    ASSERT_EQ(*reader.next(), second);
    ASSERT_EQ(*reader.next(), third);
    ASSERT_FALSE(reader.next().has_value());
    ASSERT_FALSE(reader.empty());

    reader.reset();
    ASSERT_TRUE(reader.empty());
}

TEST(HandshakeReaderTest, MessageTooLarge)
{
    HandshakeReader reader(1024);
    auto header = MakeMessage(0x0B, 1025, 0x00);
    header.resize(TLS_HANDSHAKE_HEADER_SIZE);

    reader.append(header);
    try
    {
        reader.next();
        FAIL() << "oversized message accepted";
    }
    catch (const Exception& e)
    {
        ASSERT_EQ(e.error(), Error::RecordTooLarge);
    }
}

TEST(HandshakeReaderTest, MessageAtLimit)
{
    HandshakeReader reader(1024);
    auto message = MakeMessage(0x0B, 1024, 0x00);
    reader.append(message);
    ASSERT_TRUE(reader.next().has_value());
}
