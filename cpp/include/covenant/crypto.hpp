#pragma once

#include "types.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <openssl/evp.h>

namespace covenant::crypto
{

    using Bytes = std::vector<uint8_t>;

    /**
     * Base64 encoding/decoding (standard alphabet, padded)
     */
    class Base64
    {
    public:
        /**
         * Encode bytes to base64 string
         */
        static std::string encode(const Bytes &data);

        /**
         * Decode base64 string to bytes.
         * Rejects characters outside the alphabet and missing padding.
         */
        static Result<Bytes> decode(std::string_view encoded);
    };

    /**
     * Cryptographically secure random number generation
     */
    class SecureRandom
    {
    public:
        /**
         * Fill buffer with cryptographically secure random bytes
         */
        static void fill_bytes(Bytes &buffer);

        /**
         * Generate N random bytes
         */
        static Bytes generate_bytes(size_t n);
    };

    struct EvpPkeyDeleter
    {
        void operator()(EVP_PKEY *p) const { EVP_PKEY_free(p); }
    };

    /**
     * Parsed EC private key handle.
     * Copies share the underlying key; the key itself is never mutated.
     */
    class PrivateKey
    {
    public:
        /**
         * Load a private key from PEM ("-----BEGIN ...") or from a bare
         * base64 DER PKCS#8 string. An empty passphrase means the key is
         * not encrypted. Never prompts for a passphrase.
         */
        static Result<PrivateKey> load(std::string_view text, std::string_view passphrase = {});

        /** Load from a file holding either of the forms accepted by load() */
        static Result<PrivateKey> load_file(const std::string &path, std::string_view passphrase = {});

        EVP_PKEY *get() const { return pkey_.get(); }

        /** Curve short name, e.g. "prime256v1" */
        std::string curve_name() const;

    private:
        explicit PrivateKey(std::shared_ptr<EVP_PKEY> pkey) : pkey_(std::move(pkey)) {}

        std::shared_ptr<EVP_PKEY> pkey_;

        friend class KeyPair;
    };

    /**
     * Parsed EC public key handle
     */
    class PublicKey
    {
    public:
        /**
         * Load a public key from PEM ("-----BEGIN PUBLIC KEY-----") or from
         * a bare base64 DER SubjectPublicKeyInfo string.
         */
        static Result<PublicKey> load(std::string_view text);

        static Result<PublicKey> load_file(const std::string &path);

        EVP_PKEY *get() const { return pkey_.get(); }

    private:
        explicit PublicKey(std::shared_ptr<EVP_PKEY> pkey) : pkey_(std::move(pkey)) {}

        std::shared_ptr<EVP_PKEY> pkey_;

        friend class KeyPair;
    };

    /**
     * EC key pair with export helpers.
     * The "string" forms are bare base64 DER, one line, without PEM armor.
     */
    class KeyPair
    {
    public:
        PrivateKey private_key() const;
        PublicKey public_key() const;

        /**
         * Export PKCS#8 private key as base64 DER.
         * Encrypted with PBES2/AES-256-CBC when passphrase is non-empty.
         */
        Result<std::string> to_encrypted_private_key_string(std::string_view passphrase) const;

        /** Export PKCS#8 private key as PEM, encrypted when passphrase is non-empty */
        Result<std::string> private_key_pem(std::string_view passphrase) const;

        /** Export SubjectPublicKeyInfo as base64 DER */
        Result<std::string> to_public_key_string() const;

        /** Export SubjectPublicKeyInfo as PEM */
        Result<std::string> public_key_pem() const;

    private:
        explicit KeyPair(std::shared_ptr<EVP_PKEY> pkey) : pkey_(std::move(pkey)) {}

        std::shared_ptr<EVP_PKEY> pkey_;

        friend class KeyGenerator;
    };

    /**
     * EC key pair generation
     */
    class KeyGenerator
    {
    public:
        /**
         * Generate a new key pair on the named curve.
         * Accepts NIST names ("P-256", "P-384", "P-521") and OpenSSL short names.
         */
        static Result<KeyPair> generate(std::string_view curve = "P-256");
    };

    /**
     * Drain the OpenSSL error queue into a single message
     */
    std::string openssl_error_string();

} // namespace covenant::crypto
