/*
 * klap_cipher.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: KLAP handshake hashes and session cipher for Tapo devices

**************************************************/

#ifndef HEARTH_DEVICE_TAPO_KLAP_CIPHER_HPP
#define HEARTH_DEVICE_TAPO_KLAP_CIPHER_HPP

#include <cstdint>
#include <string>
#include <string_view>

#include "device/common/device_result.hpp"

namespace hearth::device::tapo {

inline constexpr std::size_t kSeedSize = 16;
inline constexpr std::size_t kSignatureSize = 32;

[[nodiscard]] auto sha1(std::string_view data) -> std::string;
[[nodiscard]] auto sha256(std::string_view data) -> std::string;

/**
 * @brief sha256(sha1(username) + sha1(password))
 */
[[nodiscard]] auto authHash(std::string_view username,
                            std::string_view password) -> std::string;

/**
 * @brief Hash the device must return from handshake1
 */
[[nodiscard]] auto serverProof(std::string_view localSeed,
                               std::string_view remoteSeed,
                               std::string_view authHash) -> std::string;

/**
 * @brief Body of handshake2
 */
[[nodiscard]] auto clientProof(std::string_view localSeed,
                               std::string_view remoteSeed,
                               std::string_view authHash) -> std::string;

[[nodiscard]] auto randomBytes(std::size_t count) -> DeviceResult<std::string>;

[[nodiscard]] auto base64Decode(std::string_view text)
    -> DeviceResult<std::string>;

/**
 * @brief Per-session AES-128-CBC cipher with a signed sequence counter
 *
 * Key, IV prefix, signature key and the initial sequence number are all
 * derived from the two seeds and the auth hash. Each encrypt() advances
 * the sequence; the reply is decrypted with the same sequence number.
 */
class KlapCipher {
public:
    KlapCipher(std::string_view localSeed, std::string_view remoteSeed,
               std::string_view authHash);

    struct Encrypted {
        std::string payload;  // signature followed by ciphertext
        std::int32_t sequence = 0;
    };

    [[nodiscard]] auto encrypt(std::string_view plain)
        -> DeviceResult<Encrypted>;

    /**
     * @brief Decrypt a reply body (signature followed by ciphertext)
     */
    [[nodiscard]] auto decrypt(std::string_view payload,
                               std::int32_t sequence) const
        -> DeviceResult<std::string>;

    [[nodiscard]] auto sequence() const -> std::int32_t { return sequence_; }

private:
    [[nodiscard]] auto ivFor(std::int32_t sequence) const -> std::string;

    std::string key_;
    std::string ivPrefix_;
    std::string signatureKey_;
    std::int32_t sequence_ = 0;
};

}  // namespace hearth::device::tapo

#endif  // HEARTH_DEVICE_TAPO_KLAP_CIPHER_HPP
