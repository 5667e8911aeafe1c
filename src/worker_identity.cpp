#include "worker_identity.h"
#include "errors.h"
#include "file_utils.h"
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <iostream>

namespace contestrun {

namespace {

constexpr size_t ED25519_KEY_BYTES = 32;
constexpr size_t ED25519_SIGNATURE_BYTES = 64;

struct PkeyDeleter {
    void operator()(EVP_PKEY* pkey) const { EVP_PKEY_free(pkey); }
};
struct PkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};
struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
struct BioDeleter {
    void operator()(BIO* bio) const { BIO_free_all(bio); }
};

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

PkeyPtr raw_private_pkey(const std::vector<unsigned char>& key) {
    return PkeyPtr(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, key.data(), key.size()));
}

PkeyPtr raw_public_pkey(const std::vector<unsigned char>& key) {
    return PkeyPtr(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, key.data(), key.size()));
}

// Raw 32-byte halves of an Ed25519 key
bool extract_raw_keys(EVP_PKEY* pkey,
                      std::vector<unsigned char>& private_key,
                      std::vector<unsigned char>& public_key) {
    size_t public_len = ED25519_KEY_BYTES;
    size_t private_len = ED25519_KEY_BYTES;
    public_key.assign(ED25519_KEY_BYTES, 0);
    private_key.assign(ED25519_KEY_BYTES, 0);
    return EVP_PKEY_get_raw_public_key(pkey, public_key.data(), &public_len) > 0 &&
           EVP_PKEY_get_raw_private_key(pkey, private_key.data(), &private_len) > 0 &&
           public_len == ED25519_KEY_BYTES && private_len == ED25519_KEY_BYTES;
}

// Everything written to a memory BIO so far
std::string bio_contents(BIO* bio) {
    BUF_MEM* buffer = nullptr;
    BIO_get_mem_ptr(bio, &buffer);
    if (!buffer) {
        return "";
    }
    return std::string(buffer->data, buffer->length);
}

} // namespace

std::string WorkerIdentity::base64_encode(const unsigned char* data, size_t len) {
    // EVP_EncodeBlock writes 4 bytes per 3 input bytes, plus a terminator
    std::string encoded(4 * ((len + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&encoded[0]), data,
                                  static_cast<int>(len));
    encoded.resize(written > 0 ? static_cast<size_t>(written) : 0);
    return encoded;
}

std::vector<unsigned char> WorkerIdentity::base64_decode(const std::string& encoded) {
    if (encoded.empty() || encoded.size() % 4 != 0) {
        return {};
    }

    std::vector<unsigned char> decoded(encoded.size() / 4 * 3);
    int len = EVP_DecodeBlock(decoded.data(),
                              reinterpret_cast<const unsigned char*>(encoded.data()),
                              static_cast<int>(encoded.size()));
    if (len < 0) {
        return {};
    }

    // EVP_DecodeBlock counts padding as zero bytes
    size_t padding = 0;
    if (encoded[encoded.size() - 1] == '=') padding++;
    if (encoded[encoded.size() - 2] == '=') padding++;
    decoded.resize(static_cast<size_t>(len) - padding);
    return decoded;
}

std::unique_ptr<WorkerIdentity> WorkerIdentity::generate() {
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr));
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0) {
        return nullptr;
    }

    EVP_PKEY* generated = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &generated) <= 0) {
        return nullptr;
    }
    PkeyPtr pkey(generated);

    auto identity = std::unique_ptr<WorkerIdentity>(new WorkerIdentity());
    if (!extract_raw_keys(pkey.get(), identity->private_key_, identity->public_key_)) {
        return nullptr;
    }
    return identity;
}

std::unique_ptr<WorkerIdentity> WorkerIdentity::from_pem(const std::string& pem) {
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        return nullptr;
    }

    PkeyPtr pkey(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
    if (!pkey || EVP_PKEY_id(pkey.get()) != EVP_PKEY_ED25519) {
        return nullptr;
    }

    auto identity = std::unique_ptr<WorkerIdentity>(new WorkerIdentity());
    if (!extract_raw_keys(pkey.get(), identity->private_key_, identity->public_key_)) {
        return nullptr;
    }
    return identity;
}

std::unique_ptr<WorkerIdentity> WorkerIdentity::from_keyfile(const std::string& keyfile_path) {
    std::string pem;
    if (!FileUtils::read_file(keyfile_path, pem)) {
        return nullptr;
    }
    return from_pem(pem);
}

std::unique_ptr<WorkerIdentity> WorkerIdentity::load_or_create(
    const std::string& private_key_path,
    const std::string& public_key_path
) {
    if (FileUtils::exists(private_key_path)) {
        auto identity = from_keyfile(private_key_path);
        if (!identity) {
            throw IdentityError("unreadable or non-Ed25519 private key at " + private_key_path);
        }
        std::cout << "[Identity] Loaded worker key from " << private_key_path << std::endl;

        // Public half must match what the registry will be told
        std::string stored_public;
        if (!FileUtils::read_file(public_key_path, stored_public) ||
            stored_public != identity->public_key_pem()) {
            if (!identity->save_public_key(public_key_path)) {
                throw IdentityError("cannot write public key to " + public_key_path);
            }
            std::cout << "[Identity] Rewrote public key at " << public_key_path << std::endl;
        }
        return identity;
    }

    std::cout << "[Identity] No key at " << private_key_path << ", generating new worker identity" << std::endl;
    auto identity = generate();
    if (!identity) {
        throw IdentityError("Ed25519 key generation failed");
    }
    if (!identity->save_to_file(private_key_path)) {
        throw IdentityError("cannot persist private key to " + private_key_path);
    }
    if (!identity->save_public_key(public_key_path)) {
        throw IdentityError("cannot persist public key to " + public_key_path);
    }

    // Read back what was written so the running key is the persisted key
    auto reloaded = from_keyfile(private_key_path);
    if (!reloaded || reloaded->public_key_ != identity->public_key_) {
        throw IdentityError("persisted private key does not round-trip at " + private_key_path);
    }
    return reloaded;
}

bool WorkerIdentity::save_to_file(const std::string& filepath) const {
    PkeyPtr pkey = raw_private_pkey(private_key_);
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!pkey || !bio) {
        return false;
    }

    if (PEM_write_bio_PrivateKey(bio.get(), pkey.get(), nullptr, nullptr, 0, nullptr, nullptr) <= 0) {
        return false;
    }
    return FileUtils::write_file(filepath, bio_contents(bio.get()), 0600);
}

bool WorkerIdentity::save_public_key(const std::string& filepath) const {
    std::string pem = public_key_pem();
    if (pem.empty()) {
        return false;
    }
    return FileUtils::write_file(filepath, pem, 0644);
}

std::string WorkerIdentity::public_key_pem() const {
    PkeyPtr pkey = raw_public_pkey(public_key_);
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!pkey || !bio || PEM_write_bio_PUBKEY(bio.get(), pkey.get()) <= 0) {
        return "";
    }
    return bio_contents(bio.get());
}

std::string WorkerIdentity::public_key_base64() const {
    return base64_encode(public_key_.data(), public_key_.size());
}

std::vector<unsigned char> WorkerIdentity::get_public_key() const {
    return public_key_;
}

std::string WorkerIdentity::fingerprint() const {
    return FileUtils::sha256_string(std::string(public_key_.begin(), public_key_.end()));
}

std::string WorkerIdentity::sign(const std::string& data) const {
    PkeyPtr pkey = raw_private_pkey(private_key_);
    if (!pkey) {
        throw IdentityError("cannot load signing key");
    }
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw IdentityError("cannot allocate signing context");
    }

    // Ed25519 takes no digest; the message is signed directly
    if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) <= 0) {
        throw IdentityError("cannot initialise signing");
    }

    unsigned char signature[ED25519_SIGNATURE_BYTES];
    size_t signature_len = sizeof(signature);
    if (EVP_DigestSign(ctx.get(), signature, &signature_len,
                       reinterpret_cast<const unsigned char*>(data.data()), data.size()) <= 0) {
        throw IdentityError("signing failed");
    }
    return base64_encode(signature, signature_len);
}

bool WorkerIdentity::verify(
    const std::string& data,
    const std::string& signature_b64,
    const std::string& public_key_b64
) {
    std::vector<unsigned char> public_key = base64_decode(public_key_b64);
    std::vector<unsigned char> signature = base64_decode(signature_b64);
    if (public_key.size() != ED25519_KEY_BYTES || signature.size() != ED25519_SIGNATURE_BYTES) {
        return false;
    }

    PkeyPtr pkey = raw_public_pkey(public_key);
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!pkey || !ctx ||
        EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) <= 0) {
        return false;
    }

    return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                            reinterpret_cast<const unsigned char*>(data.data()), data.size()) == 1;
}

} // namespace contestrun
