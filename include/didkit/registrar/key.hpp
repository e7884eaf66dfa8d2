#pragma once

#include <datapod/datapod.hpp>
#include <didkit/common/error.hpp>
#include <didkit/document/verification_method.hpp>
#include <keylock/keylock.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace didkit {

    /// Ed25519 public key material for verification methods
    /// Header-only implementation using keylock for crypto operations
    class Key {
      public:
        /// Generate new Ed25519 keypair
        inline static dp::Result<Key, dp::Error> generate() {
            keylock::keylock crypto(keylock::Algorithm::Ed25519);
            auto keypair = crypto.generate_keypair();

            if (keypair.public_key.empty()) {
                return dp::Result<Key, dp::Error>::err(dp::Error::io_error("Failed to generate keypair"));
            }

            return dp::Result<Key, dp::Error>::ok(Key(keypair));
        }

        /// Load from public key only
        inline static dp::Result<Key, dp::Error> fromPublicKey(const std::vector<uint8_t> &public_key) {
            if (public_key.size() != 32) {
                return dp::Result<Key, dp::Error>::err(
                    dp::Error::invalid_argument("Ed25519 public key must be 32 bytes"));
            }

            keylock::KeyPair keypair;
            keypair.public_key = public_key;
            return dp::Result<Key, dp::Error>::ok(Key(keypair));
        }

        inline explicit Key(const keylock::KeyPair &keypair) : keypair_(keypair) {}

        inline const std::vector<uint8_t> &getPublicKey() const { return keypair_.public_key; }

        inline bool hasPrivateKey() const { return !keypair_.private_key.empty(); }

        /// Get unique ID (SHA-256 hash of public key, hex encoded)
        inline std::string getId() const {
            if (keypair_.public_key.empty()) {
                return "unknown";
            }

            keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
            auto hash_result = crypto.hash(keypair_.public_key);

            if (!hash_result.success) {
                return "unknown";
            }

            return keylock::keylock::to_hex(hash_result.data);
        }

        /// Get the public key as multibase-encoded string (z-base58)
        /// Using 'z' prefix for base58btc encoding per multibase spec
        inline std::string getPublicKeyMultibase() const {
            if (keypair_.public_key.empty()) {
                return "";
            }

            // Bitcoin alphabet
            static const char *ALPHABET = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

            const auto &input = keypair_.public_key;
            std::string result;

            size_t leading_zeros = 0;
            for (auto b : input) {
                if (b == 0)
                    leading_zeros++;
                else
                    break;
            }

            std::vector<uint8_t> digits;
            for (uint8_t byte : input) {
                int carry = byte;
                for (auto &digit : digits) {
                    carry += digit * 256;
                    digit = carry % 58;
                    carry /= 58;
                }
                while (carry > 0) {
                    digits.push_back(carry % 58);
                    carry /= 58;
                }
            }

            for (size_t i = 0; i < leading_zeros; i++) {
                result += '1';
            }

            // Digits are little-endian
            for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
                result += ALPHABET[*it];
            }

            return "z" + result;
        }

        /// Get the public key as an OKP JWK (base64url, no padding)
        inline PublicKeyJwk getPublicKeyJwk() const {
            static const char *ALPHABET = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

            const auto &input = keypair_.public_key;
            std::string x;
            size_t i = 0;
            for (; i + 2 < input.size(); i += 3) {
                uint32_t n = (input[i] << 16) | (input[i + 1] << 8) | input[i + 2];
                x += ALPHABET[(n >> 18) & 0x3F];
                x += ALPHABET[(n >> 12) & 0x3F];
                x += ALPHABET[(n >> 6) & 0x3F];
                x += ALPHABET[n & 0x3F];
            }
            if (i + 1 == input.size()) {
                uint32_t n = input[i] << 16;
                x += ALPHABET[(n >> 18) & 0x3F];
                x += ALPHABET[(n >> 12) & 0x3F];
            } else if (i + 2 == input.size()) {
                uint32_t n = (input[i] << 16) | (input[i + 1] << 8);
                x += ALPHABET[(n >> 18) & 0x3F];
                x += ALPHABET[(n >> 12) & 0x3F];
                x += ALPHABET[(n >> 6) & 0x3F];
            }

            return PublicKeyJwk("OKP", "Ed25519", x);
        }

        /// Equality operator (compares public keys)
        inline bool operator==(const Key &other) const { return keypair_.public_key == other.keypair_.public_key; }

        inline bool operator!=(const Key &other) const { return !(*this == other); }

      private:
        keylock::KeyPair keypair_;
    };

    /// Source of key material for new verification methods
    class KeyRing {
      public:
        virtual ~KeyRing() = default;

        /// Next key to register in a document
        virtual dp::Result<Key, dp::Error> nextKey() = 0;
    };

    /// Key ring that generates a fresh Ed25519 key on every request
    class LocalKeyRing : public KeyRing {
      public:
        LocalKeyRing() = default;

        inline dp::Result<Key, dp::Error> nextKey() override {
            auto key = Key::generate();
            if (key.is_err()) {
                return dp::Result<Key, dp::Error>::err(key_unavailable(key.error().message));
            }
            issued_++;
            return key;
        }

        /// Number of keys handed out so far
        inline size_t getIssuedCount() const { return issued_; }

      private:
        size_t issued_ = 0;
    };

} // namespace didkit
