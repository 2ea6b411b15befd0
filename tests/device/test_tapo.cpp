/*
 * test_tapo.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Tests for the KLAP cipher, Tapo device info mapping and the
KLAP session client over loopback

**************************************************/

#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>
#include <fmt/format.h>

#include "config/config_provider.hpp"
#include "device/tapo/klap_cipher.hpp"
#include "device/tapo/tapo_adapter.hpp"
#include "device/tapo/tapo_client.hpp"

using namespace hearth::device;
using namespace std::chrono_literals;
namespace asio = boost::asio;
namespace http = boost::beast::http;
using asio::ip::tcp;

namespace {

auto hex(std::string_view bytes) -> std::string {
    std::string out;
    for (unsigned char c : bytes) {
        out += fmt::format("{:02x}", c);
    }
    return out;
}

}  // namespace

// ========== KLAP ==========

class KlapCipherTest : public ::testing::Test {
protected:
    std::string localSeed_ = std::string(16, '\x11');
    std::string remoteSeed_ = std::string(16, '\x22');
    std::string auth_ = tapo::authHash("user@example.com", "secret");
};

TEST_F(KlapCipherTest, Sha256_KnownVector) {
    EXPECT_EQ(hex(tapo::sha256("abc")),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(hex(tapo::sha1("abc")),
              "a9993e364706816aba3e25717850c26c9cd0d89d");
}

TEST_F(KlapCipherTest, AuthHash_DependsOnBothCredentials) {
    EXPECT_EQ(auth_.size(), 32U);
    EXPECT_NE(auth_, tapo::authHash("user@example.com", "other"));
    EXPECT_NE(auth_, tapo::authHash("someone@example.com", "secret"));
}

TEST_F(KlapCipherTest, Proofs_AreDirectional) {
    auto server = tapo::serverProof(localSeed_, remoteSeed_, auth_);
    auto client = tapo::clientProof(localSeed_, remoteSeed_, auth_);
    EXPECT_EQ(server.size(), 32U);
    EXPECT_NE(server, client);
    EXPECT_EQ(client, tapo::serverProof(remoteSeed_, localSeed_, auth_));
}

TEST_F(KlapCipherTest, Encrypt_IncrementsSequenceAndSigns) {
    tapo::KlapCipher cipher(localSeed_, remoteSeed_, auth_);
    const auto initial = cipher.sequence();

    auto first = cipher.encrypt(R"({"method":"get_device_info"})");
    ASSERT_TRUE(first);
    EXPECT_EQ(first->sequence, static_cast<std::int32_t>(
                                   static_cast<std::uint32_t>(initial) + 1U));
    auto second = cipher.encrypt("{}");
    ASSERT_TRUE(second);
    EXPECT_EQ(second->sequence, static_cast<std::int32_t>(
                                    static_cast<std::uint32_t>(initial) + 2U));

    ASSERT_GT(first->payload.size(), tapo::kSignatureSize);
    auto body = first->payload.substr(tapo::kSignatureSize);
    EXPECT_EQ(body.size() % 16, 0U);
    EXPECT_NE(first->payload.substr(0, tapo::kSignatureSize),
              second->payload.substr(0, tapo::kSignatureSize));
}

TEST_F(KlapCipherTest, Decrypt_WithPeerCipher) {
    tapo::KlapCipher client(localSeed_, remoteSeed_, auth_);
    tapo::KlapCipher device(localSeed_, remoteSeed_, auth_);

    const std::string request = R"({"method":"set_device_info","params":{}})";
    auto encrypted = client.encrypt(request);
    ASSERT_TRUE(encrypted);
    auto plain = device.decrypt(encrypted->payload, encrypted->sequence);
    ASSERT_TRUE(plain);
    EXPECT_EQ(*plain, request);

    auto wrongSequence =
        device.decrypt(encrypted->payload, encrypted->sequence + 1);
    EXPECT_TRUE(!wrongSequence || *wrongSequence != request);
}

TEST_F(KlapCipherTest, Decrypt_ShortPayloadIsProtocolError) {
    tapo::KlapCipher cipher(localSeed_, remoteSeed_, auth_);
    auto plain = cipher.decrypt(std::string(tapo::kSignatureSize, 'x'), 1);
    ASSERT_FALSE(plain);
    EXPECT_EQ(plain.error().code, DeviceErrorCode::ProtocolError);
}

TEST_F(KlapCipherTest, CiphersFromDifferentSeedsDisagree) {
    tapo::KlapCipher a(localSeed_, remoteSeed_, auth_);
    tapo::KlapCipher b(std::string(16, '\x33'), remoteSeed_, auth_);
    EXPECT_NE(a.sequence(), b.sequence());
}

TEST(KlapUtilTest, Base64Decode) {
    EXPECT_EQ(*tapo::base64Decode("SGVsbG8="), "Hello");
    EXPECT_EQ(*tapo::base64Decode("TGl2aW5nIFJvb20="), "Living Room");
    EXPECT_EQ(*tapo::base64Decode(""), "");
    EXPECT_FALSE(tapo::base64Decode("abc"));
}

TEST(KlapUtilTest, RandomBytes) {
    auto a = tapo::randomBytes(tapo::kSeedSize);
    auto b = tapo::randomBytes(tapo::kSeedSize);
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    EXPECT_EQ(a->size(), tapo::kSeedSize);
    EXPECT_NE(*a, *b);
}

// ========== Device info ==========

TEST(TapoDeviceInfoTest, Params_PowerBrightnessColor) {
    EXPECT_EQ(*tapo::buildDeviceInfoParams(SetPower{false}),
              (json{{"device_on", false}}));

    auto dim = *tapo::buildDeviceInfoParams(SetBrightness{0});
    EXPECT_EQ(dim["brightness"], 1);
    EXPECT_EQ(dim["device_on"], true);

    auto blue = *tapo::buildDeviceInfoParams(SetColor{{0, 0, 255}});
    EXPECT_EQ(blue["hue"], 240);
    EXPECT_EQ(blue["saturation"], 100);
    EXPECT_EQ(blue["color_temp"], 0);

    auto volume = tapo::buildDeviceInfoParams(SetVolume{5});
    ASSERT_FALSE(volume);
    EXPECT_EQ(volume.error().code, DeviceErrorCode::UnsupportedCapability);
}

TEST(TapoDeviceInfoTest, StateFromInfo) {
    auto state = tapo::stateFromDeviceInfo(json{{"device_on", true},
                                                {"brightness", 42},
                                                {"hue", 0},
                                                {"saturation", 100},
                                                {"color_temp", 0}});
    EXPECT_TRUE(state.power);
    EXPECT_EQ(state.brightness, 42);
    EXPECT_EQ(state.color, (Rgb{255, 0, 0}));

    auto white = tapo::stateFromDeviceInfo(json{{"device_on", false},
                                                {"hue", 0},
                                                {"saturation", 100},
                                                {"color_temp", 2700}});
    EXPECT_FALSE(white.power);
    EXPECT_FALSE(white.color);
}

TEST(TapoDeviceInfoTest, Descriptor) {
    Endpoint endpoint{"192.168.1.33", 80};
    auto descriptor = tapo::descriptorFromDeviceInfo(
        json{{"device_id", "80223ABC"},
             {"nickname", "TGl2aW5nIFJvb20="},
             {"model", "L530"},
             {"hue", 10}},
        endpoint);
    ASSERT_TRUE(descriptor);
    EXPECT_EQ(descriptor->id.str(), "tapo:80223ABC");
    EXPECT_EQ(descriptor->displayName, "Living Room");
    EXPECT_EQ(descriptor->model, "L530");
    EXPECT_EQ(descriptor->manufacturer, "TP-Link");
    EXPECT_TRUE(descriptor->hasCapability(CapabilityTag::Color));

    auto plain = tapo::descriptorFromDeviceInfo(
        json{{"device_id", "X1"}, {"model", "L510"}}, endpoint);
    ASSERT_TRUE(plain);
    EXPECT_EQ(plain->displayName, "Tapo 33");
    EXPECT_FALSE(plain->hasCapability(CapabilityTag::Color));

    auto anonymous = tapo::descriptorFromDeviceInfo(json::object(), endpoint);
    ASSERT_FALSE(anonymous);
    EXPECT_EQ(anonymous.error().code, DeviceErrorCode::ProtocolError);
}

// ========== Adapter configuration ==========

TEST(TapoAdapterTest, Connect_WithoutCredentialsIsConfigurationError) {
    auto provider = std::make_shared<hearth::config::StaticConfigProvider>();
    tapo::TapoAdapter adapter(provider, 200ms);
    DeviceDescriptor descriptor;
    descriptor.id = DeviceId::make(Protocol::Tapo, "X1");
    descriptor.address = {"127.0.0.1", 80};

    auto session = adapter.connect(descriptor);
    ASSERT_FALSE(session);
    EXPECT_EQ(session.error().code, DeviceErrorCode::ConfigurationError);
}

TEST(TapoAdapterTest, Probe_NoHostsFindsNothing) {
    auto provider = std::make_shared<hearth::config::StaticConfigProvider>();
    tapo::TapoProbe probe(provider, 200ms);
    int sightings = 0;
    auto result = probe.scan(100ms, [&](const DeviceDescriptor&) { ++sightings; });
    EXPECT_TRUE(result);
    EXPECT_EQ(sightings, 0);
}

TEST(TapoAdapterTest, Probe_HostsWithoutCredentialsFail) {
    hearth::config::HearthConfig config;
    config.tapo.hosts = {"127.0.0.1"};
    auto provider = std::make_shared<hearth::config::StaticConfigProvider>(config);
    tapo::TapoProbe probe(provider, 200ms);

    auto result = probe.scan(100ms, [](const DeviceDescriptor&) {});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, DeviceErrorCode::ConfigurationError);
}

// ========== KLAP session over loopback ==========

namespace {

constexpr const char* kUser = "user@example.com";
constexpr const char* kPassword = "secret";

/**
 * @brief Tapo bulb serving the KLAP endpoints on 127.0.0.1
 *
 * Connections are handled one at a time. A "dropped" exchange is read and
 * then closed without a reply, the way a bulb that lost its session or
 * rebooted behaves. A "held" handshake is never answered.
 */
class FakeTapoBulb {
public:
    FakeTapoBulb()
        : auth_(tapo::authHash(kUser, kPassword)),
          acceptor_(ioc_, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)) {
        thread_ = std::thread([this] { serve(); });
    }

    ~FakeTapoBulb() {
        stopping_ = true;
        tcp::socket poke(ioc_);
        boost::system::error_code ec;
        poke.connect(acceptor_.local_endpoint(), ec);
        poke.close(ec);
        thread_.join();
    }

    [[nodiscard]] auto port() const -> std::uint16_t {
        return acceptor_.local_endpoint().port();
    }

    void dropHandshakes(int count) { dropHandshakes_ = count; }
    void dropRequests(int count) { dropRequests_ = count; }
    void expireSessions(int count) { expireSessions_ = count; }
    void holdHandshakes() { hold_ = true; }

    [[nodiscard]] auto handshakes() const -> int { return handshakes_; }
    [[nodiscard]] auto requests() const -> int { return requests_; }

    [[nodiscard]] auto lastRequest() -> json {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastRequest_;
    }

private:
    static auto take(std::atomic<int>& budget) -> bool {
        int left = budget.load();
        while (left > 0) {
            if (budget.compare_exchange_weak(left, left - 1)) {
                return true;
            }
        }
        return false;
    }

    void serve() {
        for (;;) {
            tcp::socket socket(ioc_);
            boost::system::error_code ec;
            acceptor_.accept(socket, ec);
            if (ec || stopping_) {
                return;
            }
            handle(socket);
        }
    }

    void handle(tcp::socket& socket) {
        boost::beast::flat_buffer buffer;
        http::request<http::string_body> req;
        boost::system::error_code ec;
        http::read(socket, buffer, req, ec);
        if (ec) {
            return;
        }

        http::response<http::string_body> res{http::status::ok, req.version()};
        const std::string target(req.target());
        if (target == "/app/handshake1") {
            ++handshakes_;
            if (hold_) {
                // Blocks until the client gives up and closes
                char byte = 0;
                socket.read_some(asio::buffer(&byte, 1), ec);
                return;
            }
            if (take(dropHandshakes_)) {
                return;
            }
            localSeed_ = req.body();
            remoteSeed_ = std::string(tapo::kSeedSize, '\x5a');
            res.body() = remoteSeed_ +
                         tapo::serverProof(localSeed_, remoteSeed_, auth_);
            res.set(http::field::set_cookie, "TP_SESSIONID=4F2A;TIMEOUT=1440");
        } else if (target == "/app/handshake2") {
            if (req.body() != tapo::clientProof(localSeed_, remoteSeed_, auth_)) {
                res.result(http::status::forbidden);
            } else {
                cipher_.emplace(localSeed_, remoteSeed_, auth_);
            }
        } else if (target.starts_with("/app/request?seq=") && cipher_) {
            ++requests_;
            if (take(dropRequests_)) {
                cipher_.reset();
                return;
            }
            const auto sequence =
                static_cast<std::int32_t>(std::stol(target.substr(17)));
            auto plain = cipher_->decrypt(req.body(), sequence);
            if (!plain) {
                res.result(http::status::bad_request);
            } else {
                auto request = json::parse(*plain);
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    lastRequest_ = request;
                }
                json reply{{"error_code", 0}, {"result", json::object()}};
                if (take(expireSessions_)) {
                    reply = json{{"error_code", -1301}};
                } else if (request["method"] == "get_device_info") {
                    reply["result"] = json{{"device_id", "80DEADBEEF"},
                                           {"nickname", "RGVzaw=="},
                                           {"model", "L530"},
                                           {"device_on", true},
                                           {"brightness", 60},
                                           {"hue", 0},
                                           {"saturation", 100},
                                           {"color_temp", 0}};
                }
                // The reply is encrypted under the request's sequence number
                auto encrypted = cipher_->encrypt(reply.dump());
                if (!encrypted || encrypted->sequence != sequence) {
                    res.result(http::status::bad_request);
                } else {
                    res.body() = encrypted->payload;
                }
            }
        } else {
            res.result(http::status::forbidden);
        }
        res.prepare_payload();
        http::write(socket, res, ec);
    }

    std::string auth_;
    asio::io_context ioc_;
    tcp::acceptor acceptor_;
    std::atomic<bool> stopping_{false};
    std::atomic<bool> hold_{false};
    std::atomic<int> dropHandshakes_{0};
    std::atomic<int> dropRequests_{0};
    std::atomic<int> expireSessions_{0};
    std::atomic<int> handshakes_{0};
    std::atomic<int> requests_{0};

    // Touched only by the serving thread
    std::string localSeed_;
    std::string remoteSeed_;
    std::optional<tapo::KlapCipher> cipher_;

    std::mutex mutex_;
    json lastRequest_;
    std::thread thread_;
};

}  // namespace

class KlapClientTest : public ::testing::Test {
protected:
    auto client(int maxRetries) -> tapo::KlapClient {
        return tapo::KlapClient({"127.0.0.1", bulb_.port()},
                                tapo::authHash(kUser, kPassword), 1s,
                                maxRetries);
    }

    FakeTapoBulb bulb_;
};

TEST_F(KlapClientTest, Call_HandshakesOnceAndReusesSession) {
    auto klap = client(2);
    auto first = klap.call("get_device_info");
    ASSERT_TRUE(first) << first.error().message;
    EXPECT_EQ((*first)["device_id"], "80DEADBEEF");

    ASSERT_TRUE(klap.call("set_device_info", json{{"device_on", false}}));
    EXPECT_EQ(bulb_.handshakes(), 1);
    EXPECT_EQ(bulb_.requests(), 2);
    EXPECT_EQ(bulb_.lastRequest()["params"]["device_on"], false);
}

TEST_F(KlapClientTest, Call_UnansweredRequestHandshakesAgain) {
    auto klap = client(2);
    ASSERT_TRUE(klap.call("get_device_info"));

    bulb_.dropRequests(1);
    auto result = klap.call("set_device_info", json{{"brightness", 30}});
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(bulb_.handshakes(), 2);
    EXPECT_EQ(bulb_.requests(), 3);
    EXPECT_EQ(bulb_.lastRequest()["params"]["brightness"], 30);
}

TEST_F(KlapClientTest, Call_UnansweredHandshakeIsRetried) {
    auto klap = client(1);
    bulb_.dropHandshakes(1);

    auto result = klap.call("get_device_info");
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(bulb_.handshakes(), 2);
}

TEST_F(KlapClientTest, Call_ExpiredSessionHandshakesAgain) {
    auto klap = client(1);
    ASSERT_TRUE(klap.call("get_device_info"));

    bulb_.expireSessions(1);
    auto result = klap.call("get_device_info");
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(bulb_.handshakes(), 2);
}

TEST_F(KlapClientTest, Call_WithoutRetriesFailsThenRecovers) {
    auto klap = client(0);
    ASSERT_TRUE(klap.call("get_device_info"));

    bulb_.dropRequests(1);
    auto failed = klap.call("get_device_info");
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.error().code, DeviceErrorCode::DeviceUnreachable);

    // The dropped session is not reused
    auto recovered = klap.call("get_device_info");
    ASSERT_TRUE(recovered) << recovered.error().message;
    EXPECT_EQ(bulb_.handshakes(), 2);
}

TEST_F(KlapClientTest, Call_WrongCredentialsIsConfigurationError) {
    tapo::KlapClient klap({"127.0.0.1", bulb_.port()},
                          tapo::authHash(kUser, "wrong"), 1s, 2);
    auto result = klap.call("get_device_info");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, DeviceErrorCode::ConfigurationError);
    EXPECT_EQ(bulb_.handshakes(), 1);
}

class TapoLoopbackTest : public ::testing::Test {
protected:
    void SetUp() override {
        hearth::config::HearthConfig config;
        config.tapo.username = kUser;
        config.tapo.password = kPassword;
        config.tapo.hosts = {"127.0.0.1"};
        config.tapo.port = bulb_.port();
        provider_ =
            std::make_shared<hearth::config::StaticConfigProvider>(config);

        descriptor_.id = DeviceId::make(Protocol::Tapo, "80DEADBEEF");
        descriptor_.protocol = Protocol::Tapo;
        descriptor_.address = {"127.0.0.1", bulb_.port()};
    }

    FakeTapoBulb bulb_;
    std::shared_ptr<hearth::config::StaticConfigProvider> provider_;
    DeviceDescriptor descriptor_;
};

TEST_F(TapoLoopbackTest, Adapter_CommandSurvivesLostSession) {
    tapo::TapoAdapter adapter(provider_, 1s);
    auto session = adapter.connect(descriptor_);
    ASSERT_TRUE(session) << session.error().message;

    auto state = adapter.fetchState(**session);
    ASSERT_TRUE(state) << state.error().message;
    EXPECT_TRUE(state->power);
    EXPECT_EQ(state->brightness, 60);

    bulb_.dropRequests(1);
    auto applied = adapter.applyCommand(**session, SetPower{false});
    ASSERT_TRUE(applied) << applied.error().message;
    EXPECT_EQ(bulb_.lastRequest()["params"]["device_on"], false);
    EXPECT_EQ(bulb_.handshakes(), 2);
}

TEST_F(TapoLoopbackTest, Scan_FindsConfiguredHost) {
    tapo::TapoProbe scanner(provider_, 1s);
    std::vector<DeviceDescriptor> found;
    auto result = scanner.scan(1s, [&](const DeviceDescriptor& descriptor) {
        found.push_back(descriptor);
    });
    ASSERT_TRUE(result) << result.error().message;
    ASSERT_EQ(found.size(), 1U);
    EXPECT_EQ(found[0].id.str(), "tapo:80DEADBEEF");
    EXPECT_EQ(found[0].displayName, "Desk");
    EXPECT_EQ(found[0].address.port, bulb_.port());
}

TEST_F(TapoLoopbackTest, Scan_SilentHostIsBoundedByWindow) {
    bulb_.holdHandshakes();
    tapo::TapoProbe scanner(provider_, 10s);
    int sightings = 0;

    const auto start = std::chrono::steady_clock::now();
    auto result = scanner.scan(200ms, [&](const DeviceDescriptor&) {
        ++sightings;
    });
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(result);
    EXPECT_EQ(sightings, 0);
    EXPECT_LT(elapsed, 3s);
}
