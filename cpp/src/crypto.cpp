#include "covenant/crypto.hpp"
#include <sodium.h>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/objects.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <cstring>
#include <format>
#include <fstream>
#include <sstream>

namespace covenant::crypto
{

    // Initialize libsodium on library load
    static struct SodiumInitializer
    {
        SodiumInitializer()
        {
            if (sodium_init() < 0)
            {
                throw std::runtime_error("Failed to initialize libsodium");
            }
        }
    } sodium_initializer;

    namespace
    {
        struct BioDeleter
        {
            void operator()(BIO *p) const { BIO_free(p); }
        };
        using BioPtr = std::unique_ptr<BIO, BioDeleter>;

        struct PkeyCtxDeleter
        {
            void operator()(EVP_PKEY_CTX *p) const { EVP_PKEY_CTX_free(p); }
        };

        std::string_view trim(std::string_view s)
        {
            const auto first = s.find_first_not_of(" \t\r\n");
            if (first == std::string_view::npos)
                return {};
            const auto last = s.find_last_not_of(" \t\r\n");
            return s.substr(first, last - first + 1);
        }

        bool is_pem(std::string_view text)
        {
            return text.starts_with("-----BEGIN");
        }

        BioPtr memory_bio(const void *data, size_t size)
        {
            return BioPtr(BIO_new_mem_buf(data, static_cast<int>(size)));
        }

        BioPtr output_bio()
        {
            return BioPtr(BIO_new(BIO_s_mem()));
        }

        Bytes bio_bytes(BIO *bio)
        {
            BUF_MEM *mem = nullptr;
            BIO_get_mem_ptr(bio, &mem);
            if (!mem || mem->length == 0)
                return {};
            auto *begin = reinterpret_cast<const uint8_t *>(mem->data);
            return Bytes(begin, begin + mem->length);
        }

        std::string bio_string(BIO *bio)
        {
            BUF_MEM *mem = nullptr;
            BIO_get_mem_ptr(bio, &mem);
            if (!mem)
                return {};
            return std::string(mem->data, mem->length);
        }

        // Supplies the passphrase to OpenSSL. Returning 0 makes OpenSSL fail
        // instead of prompting on the terminal.
        int passphrase_callback(char *buf, int size, int /*rwflag*/, void *userdata)
        {
            const auto *pass = static_cast<const std::string_view *>(userdata);
            if (!pass || pass->empty() || pass->size() > static_cast<size_t>(size))
                return 0;
            std::memcpy(buf, pass->data(), pass->size());
            return static_cast<int>(pass->size());
        }

        Result<std::shared_ptr<EVP_PKEY>> adopt_ec_key(EVP_PKEY *raw, std::string_view what)
        {
            if (!raw)
            {
                return std::unexpected(CovenantError::key(
                    std::format("Unable to load {}: {}", what, openssl_error_string())));
            }
            std::shared_ptr<EVP_PKEY> pkey(raw, EvpPkeyDeleter{});
            if (EVP_PKEY_base_id(raw) != EVP_PKEY_EC)
            {
                return std::unexpected(CovenantError::key(
                    std::format("Unsupported {} type; only EC keys are accepted", what)));
            }
            return pkey;
        }

        Result<std::string> read_text_file(const std::string &path)
        {
            std::ifstream file(path);
            if (!file.is_open())
            {
                return std::unexpected(CovenantError::io("Failed to open key file: " + path));
            }
            std::stringstream buffer;
            buffer << file.rdbuf();
            return buffer.str();
        }
    } // namespace

    std::string openssl_error_string()
    {
        std::string message;
        char buf[256];
        for (unsigned long err = ERR_get_error(); err != 0; err = ERR_get_error())
        {
            ERR_error_string_n(err, buf, sizeof(buf));
            if (!message.empty())
                message += "; ";
            message += buf;
        }
        return message.empty() ? std::string("unknown OpenSSL error") : message;
    }

    // ============================================================================
    // Base64 Implementation
    // ============================================================================

    std::string Base64::encode(const Bytes &data)
    {
        size_t b64_len = sodium_base64_encoded_len(data.size(), sodium_base64_VARIANT_ORIGINAL);
        std::string encoded(b64_len, '\0');

        sodium_bin2base64(
            encoded.data(),
            b64_len,
            data.data(),
            data.size(),
            sodium_base64_VARIANT_ORIGINAL);

        // Remove null terminator
        encoded.resize(std::strlen(encoded.c_str()));
        return encoded;
    }

    Result<Bytes> Base64::decode(std::string_view encoded)
    {
        Bytes decoded(encoded.size() + 1); // Worst case size
        size_t decoded_len = 0;

        if (sodium_base642bin(
                decoded.data(),
                decoded.size(),
                encoded.data(),
                encoded.size(),
                nullptr, // ignore characters
                &decoded_len,
                nullptr, // end pointer
                sodium_base64_VARIANT_ORIGINAL) != 0)
        {
            return std::unexpected(CovenantError::invalid_input("Invalid base64 encoding"));
        }

        decoded.resize(decoded_len);
        return decoded;
    }

    // ============================================================================
    // SecureRandom Implementation
    // ============================================================================

    void SecureRandom::fill_bytes(Bytes &buffer)
    {
        randombytes_buf(buffer.data(), buffer.size());
    }

    Bytes SecureRandom::generate_bytes(size_t n)
    {
        Bytes buffer(n);
        randombytes_buf(buffer.data(), n);
        return buffer;
    }

    // ============================================================================
    // Key loading
    // ============================================================================

    Result<PrivateKey> PrivateKey::load(std::string_view text, std::string_view passphrase)
    {
        auto trimmed = trim(text);
        if (trimmed.empty())
        {
            return std::unexpected(CovenantError::key("Private key text is empty"));
        }

        EVP_PKEY *raw = nullptr;
        if (is_pem(trimmed))
        {
            auto bio = memory_bio(trimmed.data(), trimmed.size());
            raw = PEM_read_bio_PrivateKey(bio.get(), nullptr, passphrase_callback, &passphrase);
        }
        else
        {
            auto der = Base64::decode(trimmed);
            if (!der)
            {
                return std::unexpected(CovenantError::key("Private key is neither PEM nor base64 DER"));
            }
            if (!passphrase.empty())
            {
                auto bio = memory_bio(der->data(), der->size());
                raw = d2i_PKCS8PrivateKey_bio(bio.get(), nullptr, passphrase_callback, &passphrase);
            }
            if (!raw)
            {
                // Unencrypted PKCS#8 or traditional EC key
                auto bio = memory_bio(der->data(), der->size());
                raw = d2i_PrivateKey_bio(bio.get(), nullptr);
            }
            sodium_memzero(der->data(), der->size());
        }

        auto pkey = adopt_ec_key(raw, "private key");
        if (!pkey)
            return std::unexpected(pkey.error());
        return PrivateKey(std::move(*pkey));
    }

    Result<PrivateKey> PrivateKey::load_file(const std::string &path, std::string_view passphrase)
    {
        auto text = read_text_file(path);
        if (!text)
            return std::unexpected(text.error());
        auto key = load(*text, passphrase);
        sodium_memzero(text->data(), text->size());
        return key;
    }

    std::string PrivateKey::curve_name() const
    {
        char name[80] = {0};
        size_t len = 0;
        if (EVP_PKEY_get_group_name(pkey_.get(), name, sizeof(name), &len) != 1)
        {
            ERR_clear_error();
            return {};
        }
        return std::string(name, len);
    }

    Result<PublicKey> PublicKey::load(std::string_view text)
    {
        auto trimmed = trim(text);
        if (trimmed.empty())
        {
            return std::unexpected(CovenantError::key("Public key text is empty"));
        }

        EVP_PKEY *raw = nullptr;
        if (is_pem(trimmed))
        {
            auto bio = memory_bio(trimmed.data(), trimmed.size());
            raw = PEM_read_bio_PUBKEY(bio.get(), nullptr, passphrase_callback, nullptr);
        }
        else
        {
            auto der = Base64::decode(trimmed);
            if (!der)
            {
                return std::unexpected(CovenantError::key("Public key is neither PEM nor base64 DER"));
            }
            auto bio = memory_bio(der->data(), der->size());
            raw = d2i_PUBKEY_bio(bio.get(), nullptr);
        }

        auto pkey = adopt_ec_key(raw, "public key");
        if (!pkey)
            return std::unexpected(pkey.error());
        return PublicKey(std::move(*pkey));
    }

    Result<PublicKey> PublicKey::load_file(const std::string &path)
    {
        auto text = read_text_file(path);
        if (!text)
            return std::unexpected(text.error());
        return load(*text);
    }

    // ============================================================================
    // KeyPair Implementation
    // ============================================================================

    PrivateKey KeyPair::private_key() const
    {
        return PrivateKey(pkey_);
    }

    PublicKey KeyPair::public_key() const
    {
        return PublicKey(pkey_);
    }

    Result<std::string> KeyPair::to_encrypted_private_key_string(std::string_view passphrase) const
    {
        auto bio = output_bio();
        std::string pass(passphrase);
        const EVP_CIPHER *cipher = pass.empty() ? nullptr : EVP_aes_256_cbc();

        int ok = i2d_PKCS8PrivateKey_bio(
            bio.get(),
            pkey_.get(),
            cipher,
            pass.empty() ? nullptr : pass.data(),
            static_cast<int>(pass.size()),
            nullptr,
            nullptr);
        sodium_memzero(pass.data(), pass.size());
        if (ok != 1)
        {
            return std::unexpected(CovenantError::key(
                std::format("Failed to export private key: {}", openssl_error_string())));
        }

        auto der = bio_bytes(bio.get());
        auto encoded = Base64::encode(der);
        sodium_memzero(der.data(), der.size());
        return encoded;
    }

    Result<std::string> KeyPair::private_key_pem(std::string_view passphrase) const
    {
        auto bio = output_bio();
        std::string pass(passphrase);
        const EVP_CIPHER *cipher = pass.empty() ? nullptr : EVP_aes_256_cbc();

        int ok = PEM_write_bio_PKCS8PrivateKey(
            bio.get(),
            pkey_.get(),
            cipher,
            pass.empty() ? nullptr : pass.data(),
            static_cast<int>(pass.size()),
            nullptr,
            nullptr);
        sodium_memzero(pass.data(), pass.size());
        if (ok != 1)
        {
            return std::unexpected(CovenantError::key(
                std::format("Failed to export private key: {}", openssl_error_string())));
        }
        return bio_string(bio.get());
    }

    Result<std::string> KeyPair::to_public_key_string() const
    {
        auto bio = output_bio();
        if (i2d_PUBKEY_bio(bio.get(), pkey_.get()) != 1)
        {
            return std::unexpected(CovenantError::key(
                std::format("Failed to export public key: {}", openssl_error_string())));
        }
        return Base64::encode(bio_bytes(bio.get()));
    }

    Result<std::string> KeyPair::public_key_pem() const
    {
        auto bio = output_bio();
        if (PEM_write_bio_PUBKEY(bio.get(), pkey_.get()) != 1)
        {
            return std::unexpected(CovenantError::key(
                std::format("Failed to export public key: {}", openssl_error_string())));
        }
        return bio_string(bio.get());
    }

    // ============================================================================
    // KeyGenerator Implementation
    // ============================================================================

    Result<KeyPair> KeyGenerator::generate(std::string_view curve)
    {
        std::string curve_name(curve);
        int nid = EC_curve_nist2nid(curve_name.c_str());
        if (nid == NID_undef)
            nid = OBJ_sn2nid(curve_name.c_str());
        if (nid == NID_undef)
        {
            return std::unexpected(CovenantError::key("Unknown elliptic curve: " + curve_name));
        }

        std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter> ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr));
        if (!ctx ||
            EVP_PKEY_keygen_init(ctx.get()) <= 0 ||
            EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx.get(), nid) <= 0)
        {
            return std::unexpected(CovenantError::key(
                std::format("Failed to set up EC key generation: {}", openssl_error_string())));
        }

        EVP_PKEY *raw = nullptr;
        if (EVP_PKEY_keygen(ctx.get(), &raw) <= 0)
        {
            return std::unexpected(CovenantError::key(
                std::format("EC key generation failed: {}", openssl_error_string())));
        }
        return KeyPair(std::shared_ptr<EVP_PKEY>(raw, EvpPkeyDeleter{}));
    }

} // namespace covenant::crypto
