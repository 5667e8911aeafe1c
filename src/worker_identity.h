#pragma once

#include <string>
#include <vector>
#include <memory>

namespace contestrun {

// Worker identity and cryptographic signing. The private key never leaves
// this object; results are signed with Ed25519 (deterministic, no digest
// parameter), so a verifier needs only the raw public key and the exact
// signed bytes.
class WorkerIdentity {
public:
    // Load identity from private key file (PKCS#8 PEM)
    static std::unique_ptr<WorkerIdentity> from_keyfile(const std::string& keyfile_path);

    // Load identity from PEM text
    static std::unique_ptr<WorkerIdentity> from_pem(const std::string& pem);

    // Generate new identity (creates new Ed25519 keypair)
    static std::unique_ptr<WorkerIdentity> generate();

    // Startup provisioning: load the private key if it exists, otherwise
    // generate one and persist both halves. A key that exists but cannot be
    // read, or a fresh key that cannot be persisted, throws IdentityError;
    // the worker never runs with a key it could not later prove.
    static std::unique_ptr<WorkerIdentity> load_or_create(
        const std::string& private_key_path,
        const std::string& public_key_path
    );

    // Public key as base64 of the 32 raw bytes
    std::string public_key_base64() const;

    // Public key as SubjectPublicKeyInfo PEM (registration payload)
    std::string public_key_pem() const;

    // Public key (raw bytes)
    std::vector<unsigned char> get_public_key() const;

    // SHA-256 hex of the raw public key
    std::string fingerprint() const;

    // Sign data and return base64-encoded signature. Throws IdentityError.
    std::string sign(const std::string& data) const;

    // Verify signature (static utility, mirrors the scoring service)
    static bool verify(
        const std::string& data,
        const std::string& signature_b64,
        const std::string& public_key_b64
    );

    // Save private key to file (PEM format, mode 0600)
    bool save_to_file(const std::string& filepath) const;

    // Save public key to file (PEM format, mode 0644)
    bool save_public_key(const std::string& filepath) const;

    // Helper: Encode bytes to base64
    static std::string base64_encode(const unsigned char* data, size_t len);

    // Helper: Decode base64 to bytes
    static std::vector<unsigned char> base64_decode(const std::string& encoded);

private:
    WorkerIdentity() = default;

    std::vector<unsigned char> private_key_;  // 32 bytes for Ed25519
    std::vector<unsigned char> public_key_;   // 32 bytes for Ed25519
};

} // namespace contestrun
