#include "ferry/crypto/x25519.hpp"

#include <sodium.h>

namespace ferry::crypto {

X25519KeyPair generate_keypair() {
    X25519KeyPair kp;
    crypto_box_keypair(kp.public_key.data(), kp.secret_key.data());
    return kp;
}

PublicKey derive_public_key(const SecretKey& secret_key) {
    PublicKey pk;
    crypto_scalarmult_base(pk.data(), secret_key.data());
    return pk;
}

std::optional<SharedSecret> key_exchange(const SecretKey& our_secret,
                                          const PublicKey& their_public) {
    SharedSecret shared;

    // crypto_scalarmult returns -1 when the result is the all-zero point
    if (crypto_scalarmult(shared.data(), our_secret.data(), their_public.data()) != 0) {
        secure_zero(shared.data(), shared.size());
        return std::nullopt;
    }

    if (is_all_zero(shared)) {
        return std::nullopt;
    }

    return shared;
}

void wipe(X25519KeyPair& key_pair) {
    secure_zero(key_pair.secret_key.data(), key_pair.secret_key.size());
    secure_zero(key_pair.public_key.data(), key_pair.public_key.size());
}

}  // namespace ferry::crypto
