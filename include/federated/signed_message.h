/*
 * Signed message envelope for federated learning traffic
 * Ed25519 signatures via OpenSSL with a hash-based fallback
 */

#ifndef FEDCORE_SIGNED_MESSAGE_H
#define FEDCORE_SIGNED_MESSAGE_H

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <openssl/evp.h>

#include "utils/json.h"

namespace fedcore {

using utils::JsonValue;

enum class MessageType {
    REGISTER,
    HEARTBEAT,
    ROUND_START,
    LOCAL_UPDATE,
    GLOBAL_MODEL,
    ERROR
};

std::string messageTypeToString(MessageType type);
// Throws std::invalid_argument for unknown names
MessageType messageTypeFromString(const std::string& name);

struct KeyPair {
    std::vector<uint8_t> public_key;   // 32 raw bytes
    std::vector<uint8_t> private_key;  // 32 raw bytes
};

// Fresh Ed25519 keypair; throws std::runtime_error if OpenSSL cannot provide one
KeyPair generateKeypair();

class MessageSigner {
public:
    virtual ~MessageSigner() = default;

    virtual std::string scheme() const = 0;
    virtual std::vector<uint8_t> sign(const std::vector<uint8_t>& data) const = 0;
};

class Ed25519Signer : public MessageSigner {
public:
    static constexpr const char* SCHEME = "ed25519";

    explicit Ed25519Signer(const std::vector<uint8_t>& private_key);

    std::string scheme() const override { return SCHEME; }
    std::vector<uint8_t> sign(const std::vector<uint8_t>& data) const override;

private:
    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key_;
};

// SHA-256(data || secret). Offers no third-party verifiability.
class HashFallbackSigner : public MessageSigner {
public:
    static constexpr const char* SCHEME = "sha256-fallback";

    explicit HashFallbackSigner(std::vector<uint8_t> secret);

    std::string scheme() const override { return SCHEME; }
    std::vector<uint8_t> sign(const std::vector<uint8_t>& data) const override;

private:
    std::vector<uint8_t> secret_;
};

// Picks the signing scheme once. Falls back to HashFallbackSigner when
// Ed25519 is not wanted or OpenSSL rejects the key.
std::unique_ptr<MessageSigner> makeMessageSigner(bool prefer_ed25519,
                                                 const std::vector<uint8_t>& private_key);

struct SignedMessage {
    std::string message_id;
    std::string sender_id;
    MessageType message_type = MessageType::HEARTBEAT;
    JsonValue payload;
    double timestamp = 0.0;
    std::string signature;          // hex
    std::string signature_scheme;

    SignedMessage() = default;
    SignedMessage(std::string sender_id, MessageType type, JsonValue payload);

    // Canonical JSON of every field except the signature
    std::vector<uint8_t> canonicalBytes() const;

    void sign(const MessageSigner& signer);
    bool verify(const std::vector<uint8_t>& public_key) const;

    JsonValue toJson() const;
    static SignedMessage fromJson(const JsonValue& json);

    std::vector<uint8_t> toBytes() const;
    // Throws std::runtime_error on malformed input
    static SignedMessage fromBytes(const std::vector<uint8_t>& data);
};

} // namespace fedcore

#endif // FEDCORE_SIGNED_MESSAGE_H
