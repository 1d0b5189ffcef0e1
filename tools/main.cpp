#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <casket/log/log_manager.hpp>
#include <casket/opt/option_builder.hpp>
#include <casket/opt/cmd_line_options_parser.hpp>
#include <casket/utils/exception.hpp>
#include <casket/utils/string.hpp>

#include <tlsh/crypto/cert.hpp>
#include <tlsh/crypto/cert_manager.hpp>
#include <tlsh/crypto/cert_verifier.hpp>

#include <tlsh/socket/tcp_transport.hpp>

#include <tlsh/tls/exception.hpp>
#include <tlsh/tls/settings.hpp>
#include <tlsh/tls/state_machine.hpp>

using namespace casket;
using namespace casket::opt;
using namespace tlsh;

namespace
{

inline Level ParseLogLevel(std::string_view str)
{
    if (casket::iequals(str, "alert"))
    {
        return Level::Alert;
    }
    else if (casket::iequals(str, "crit"))
    {
        return Level::Critical;
    }
    else if (casket::iequals(str, "error"))
    {
        return Level::Error;
    }
    else if (casket::iequals(str, "warn"))
    {
        return Level::Warning;
    }
    else if (casket::iequals(str, "notice"))
    {
        return Level::Notice;
    }
    else if (casket::iequals(str, "info"))
    {
        return Level::Info;
    }
    else if (casket::iequals(str, "debug"))
    {
        return Level::Debug;
    }
    return Level::Warning;
}

struct Options
{
    std::string host;
    std::size_t port{443};
    std::string caFile;
    std::string caDir;
    std::string ciphers;
    std::string keylog;
    std::string request;
    std::string logLevel;
    std::size_t timeout{10};
};

class ClientCommand final
{
public:
    ClientCommand()
    {
        // clang-format off
        parser_.add(
            OptionBuilder("help")
                .setDescription("Print help message")
                .build()
        );
        parser_.add(
            OptionBuilder("host", Value(&options_.host))
                .setDescription("Server host name")
                .setRequired()
                .build()
        );
        parser_.add(
            OptionBuilder("port", Value(&options_.port))
                .setDescription("Server port")
                .build()
        );
        parser_.add(
            OptionBuilder("ca_file", Value(&options_.caFile))
                .setDescription("File with trusted CA certificates")
                .build()
        );
        parser_.add(
            OptionBuilder("ca_dir", Value(&options_.caDir))
                .setDescription("Directory with trusted CA certificates")
                .build()
        );
        parser_.add(
            OptionBuilder("ciphers", Value(&options_.ciphers))
                .setDescription("Colon separated list of cipher suites")
                .build()
        );
        parser_.add(
            OptionBuilder("insecure")
                .setDescription("Skip server certificate verification")
                .build()
        );
        parser_.add(
            OptionBuilder("timeout", Value(&options_.timeout))
                .setDescription("Connect and read timeout (in seconds)")
                .build()
        );
        parser_.add(
            OptionBuilder("keylog", Value(&options_.keylog))
                .setDescription("Append NSS key log lines to the file")
                .build()
        );
        parser_.add(
            OptionBuilder("request", Value(&options_.request))
                .setDescription("Request path sent after the handshake")
                .setDefaultValue("/")
                .build()
        );
        parser_.add(
            OptionBuilder("log_level", Value(&options_.logLevel))
                .setDescription("Logging level (error, warn, info, debug)")
                .setDefaultValue("warn")
                .build()
        );
        // clang-format on
    }

    int execute(const std::vector<std::string_view>& args)
    {
        parser_.parse(args);
        if (parser_.isUsed("help"))
        {
            parser_.help(std::cout, "tlsh-client");
            return EXIT_SUCCESS;
        }
        parser_.validate();

        LogManager::Instance().enable(Type::Console);
        LogManager::Instance().setLevel(ParseLogLevel(options_.logLevel));

        crypto::CertManager manager;
        if (!options_.caFile.empty())
        {
            manager.loadFile(options_.caFile);
        }
        if (!options_.caDir.empty())
        {
            manager.loadDirectory(options_.caDir);
        }
        if (options_.caFile.empty() && options_.caDir.empty())
        {
            manager.useDefaultPaths();
        }

        crypto::CertVerifier verifier(manager);
        crypto::InsecureCertVerifier insecureVerifier;

        std::chrono::milliseconds timeout = std::chrono::seconds(options_.timeout);

        tls::ClientSettings settings;
        settings.setServerName(options_.host);
        settings.setReadTimeout(timeout);
        if (parser_.isUsed("insecure"))
        {
            warning("server certificate verification is disabled");
            settings.setCertVerifier(&insecureVerifier);
        }
        else
        {
            settings.setCertVerifier(&verifier);
        }
        if (!options_.ciphers.empty())
        {
            settings.setCipherList(options_.ciphers);
        }

        std::ofstream keylog;
        if (!options_.keylog.empty())
        {
            keylog.open(options_.keylog, std::ios::out | std::ios::app);
            ThrowIfFalse(keylog.is_open(), "failed to open key log file '" + options_.keylog + "'");
            settings.setKeyLogCallback([&keylog](std::string_view line) { keylog << line << std::endl; });
        }

        socket::TcpTransport transport;
        std::error_code ec;
        transport.connect(options_.host, static_cast<uint16_t>(options_.port), timeout, ec);
        if (ec)
        {
            throw std::system_error(ec, "failed to connect to " + options_.host);
        }

        tls::StateMachine conn(transport, settings);
        conn.handshake();

        const auto& session = conn.getSession();
        std::cout << "Protocol: " << session.version.toString() << std::endl;
        std::cout << "Cipher suite: " << session.cipherSuite->name << std::endl;
        std::cout << "Server certificate: " << crypto::Cert::subjectName(session.serverCert.get()) << std::endl;
        std::cout << "Issuer: " << crypto::Cert::issuerName(session.serverCert.get()) << std::endl;

        std::string request = "GET " + options_.request + " HTTP/1.1\r\nHost: " + options_.host +
                              "\r\nConnection: close\r\n\r\n";
        conn.write({reinterpret_cast<const uint8_t*>(request.data()), request.size()});

        std::vector<uint8_t> buffer(16 * 1024);
        for (;;)
        {
            size_t n{0};
            try
            {
                n = conn.read(buffer);
            }
            catch (const tls::Exception& e)
            {
                if (e.error() != tls::Error::ConnectionClosed)
                {
                    throw;
                }
                notice("server closed the connection without close_notify");
            }
            if (n == 0)
            {
                break;
            }
            std::cout.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(n));
        }
        std::cout << std::endl;

        if (conn.isEstablished())
        {
            conn.shutdown();
        }
        return EXIT_SUCCESS;
    }

private:
    CmdLineOptionsParser parser_;
    Options options_;
};

} // namespace

int main(int argc, char* argv[])
{
    try
    {
        std::vector<std::string_view> args(argv + 1, argv + argc);

        if (args.empty())
        {
            std::cerr << "Use '--help' to print options" << std::endl;
            return EXIT_SUCCESS;
        }

        ClientCommand cmd;
        return cmd.execute(args);
    }
    catch (const std::system_error& e)
    {
        std::cerr << e.what() << " [" << e.code() << "]" << std::endl;
        return EXIT_FAILURE;
    }
    catch (const std::exception& e)
    {
        std::cerr << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
