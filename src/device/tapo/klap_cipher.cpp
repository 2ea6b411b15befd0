/*
 * klap_cipher.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: KLAP handshake hashes and session cipher for Tapo devices

**************************************************/

#include "klap_cipher.hpp"

#include <array>
#include <memory>

#include <openssl/evp.h>
#include <openssl/rand.h>

namespace hearth::device::tapo {

namespace {

constexpr std::size_t kKeySize = 16;
constexpr std::size_t kIvPrefixSize = 12;
constexpr std::size_t kSignatureKeySize = 28;

auto digest(std::string_view data, const EVP_MD* md) -> std::string {
    std::array<unsigned char, EVP_MAX_MD_SIZE> out{};
    unsigned int size = 0;
    if (EVP_Digest(data.data(), data.size(), out.data(), &size, md,
                   nullptr) != 1) {
        throw ProtocolException("message digest failed");
    }
    return std::string(reinterpret_cast<const char*>(out.data()), size);
}

void appendBigEndian(std::string& out, std::int32_t value) {
    const auto u = static_cast<std::uint32_t>(value);
    out.push_back(static_cast<char>((u >> 24) & 0xFF));
    out.push_back(static_cast<char>((u >> 16) & 0xFF));
    out.push_back(static_cast<char>((u >> 8) & 0xFF));
    out.push_back(static_cast<char>(u & 0xFF));
}

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};

auto runCbc(std::string_view input, std::string_view key, std::string_view iv,
            bool encrypting) -> DeviceResult<std::string> {
    std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter> ctx(
        EVP_CIPHER_CTX_new());
    if (!ctx ||
        EVP_CipherInit_ex(ctx.get(), EVP_aes_128_cbc(), nullptr,
                          reinterpret_cast<const unsigned char*>(key.data()),
                          reinterpret_cast<const unsigned char*>(iv.data()),
                          encrypting ? 1 : 0) != 1) {
        return failure<std::string>(
            error::internalError("AES-128-CBC init failed"));
    }
    std::string out(input.size() + 16, '\0');
    int written = 0;
    int finalWritten = 0;
    auto* outBytes = reinterpret_cast<unsigned char*>(out.data());
    if (EVP_CipherUpdate(ctx.get(), outBytes, &written,
                         reinterpret_cast<const unsigned char*>(input.data()),
                         static_cast<int>(input.size())) != 1 ||
        EVP_CipherFinal_ex(ctx.get(), outBytes + written, &finalWritten) !=
            1) {
        return failure<std::string>(error::protocolError(
            encrypting ? "KLAP encryption failed" : "KLAP decryption failed"));
    }
    out.resize(static_cast<std::size_t>(written + finalWritten));
    return out;
}

auto derive(std::string_view label, std::string_view localSeed,
            std::string_view remoteSeed, std::string_view authHash)
    -> std::string {
    std::string input(label);
    input.append(localSeed);
    input.append(remoteSeed);
    input.append(authHash);
    return sha256(input);
}

}  // namespace

auto sha1(std::string_view data) -> std::string {
    return digest(data, EVP_sha1());
}

auto sha256(std::string_view data) -> std::string {
    return digest(data, EVP_sha256());
}

auto authHash(std::string_view username, std::string_view password)
    -> std::string {
    return sha256(sha1(username) + sha1(password));
}

auto serverProof(std::string_view localSeed, std::string_view remoteSeed,
                 std::string_view authHash) -> std::string {
    return derive("", localSeed, remoteSeed, authHash);
}

auto clientProof(std::string_view localSeed, std::string_view remoteSeed,
                 std::string_view authHash) -> std::string {
    return derive("", remoteSeed, localSeed, authHash);
}

auto randomBytes(std::size_t count) -> DeviceResult<std::string> {
    std::string out(count, '\0');
    if (RAND_bytes(reinterpret_cast<unsigned char*>(out.data()),
                   static_cast<int>(count)) != 1) {
        return failure<std::string>(
            error::internalError("RAND_bytes failed"));
    }
    return out;
}

auto base64Decode(std::string_view text) -> DeviceResult<std::string> {
    if (text.size() % 4 != 0) {
        return failure<std::string>(
            error::protocolError("invalid base64 length"));
    }
    std::string out(text.size() / 4 * 3, '\0');
    const int size = EVP_DecodeBlock(
        reinterpret_cast<unsigned char*>(out.data()),
        reinterpret_cast<const unsigned char*>(text.data()),
        static_cast<int>(text.size()));
    if (size < 0) {
        return failure<std::string>(error::protocolError("invalid base64"));
    }
    // EVP_DecodeBlock keeps the zero bytes produced by padding
    std::size_t padding = 0;
    if (!text.empty() && text.back() == '=') {
        ++padding;
        if (text.size() > 1 && text[text.size() - 2] == '=') {
            ++padding;
        }
    }
    out.resize(static_cast<std::size_t>(size) - padding);
    return out;
}

// ==================== KlapCipher ====================

KlapCipher::KlapCipher(std::string_view localSeed, std::string_view remoteSeed,
                       std::string_view authHash) {
    key_ = derive("lsk", localSeed, remoteSeed, authHash).substr(0, kKeySize);
    signatureKey_ = derive("ldk", localSeed, remoteSeed, authHash)
                        .substr(0, kSignatureKeySize);

    const auto iv = derive("iv", localSeed, remoteSeed, authHash);
    ivPrefix_ = iv.substr(0, kIvPrefixSize);
    const auto* tail =
        reinterpret_cast<const unsigned char*>(iv.data()) + iv.size() - 4;
    sequence_ = static_cast<std::int32_t>(
        (static_cast<std::uint32_t>(tail[0]) << 24) |
        (static_cast<std::uint32_t>(tail[1]) << 16) |
        (static_cast<std::uint32_t>(tail[2]) << 8) |
        static_cast<std::uint32_t>(tail[3]));
}

auto KlapCipher::ivFor(std::int32_t sequence) const -> std::string {
    std::string iv = ivPrefix_;
    appendBigEndian(iv, sequence);
    return iv;
}

auto KlapCipher::encrypt(std::string_view plain) -> DeviceResult<Encrypted> {
    // Wraps like the device's signed 32-bit counter
    sequence_ = static_cast<std::int32_t>(
        static_cast<std::uint32_t>(sequence_) + 1U);
    auto cipher = runCbc(plain, key_, ivFor(sequence_), true);
    if (!cipher) {
        return failure<Encrypted>(cipher.error());
    }

    std::string signed_ = signatureKey_;
    appendBigEndian(signed_, sequence_);
    signed_.append(*cipher);

    Encrypted result;
    result.payload = sha256(signed_) + *cipher;
    result.sequence = sequence_;
    return result;
}

auto KlapCipher::decrypt(std::string_view payload,
                         std::int32_t sequence) const
    -> DeviceResult<std::string> {
    if (payload.size() <= kSignatureSize) {
        return failure<std::string>(
            error::protocolError("KLAP reply too short"));
    }
    return runCbc(payload.substr(kSignatureSize), key_, ivFor(sequence),
                  false);
}

}  // namespace hearth::device::tapo
