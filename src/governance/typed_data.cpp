// QUORUM - Typed-Data Ballots Implementation
// Copyright (c) 2024 QUORUM Developers
// MIT License

#include <quorum/governance/typed_data.h>
#include <quorum/crypto/keccak.h>
#include <quorum/crypto/keys.h>
#include <quorum/util/logging.h>

namespace quorum {
namespace governance {

const Hash256& DomainTypeHash() {
    static const Hash256 hash = Keccak256Hash(std::string(DOMAIN_TYPE));
    return hash;
}

const Hash256& BallotTypeHash() {
    static const Hash256 hash = Keccak256Hash(std::string(BALLOT_TYPE));
    return hash;
}

// ============================================================================
// ABI Words
// ============================================================================

Hash256 EncodeUint256(uint64_t value) {
    Hash256 word;
    for (size_t i = 0; i < 8; ++i) {
        word[Hash256::SIZE - 1 - i] = static_cast<Byte>(value >> (8 * i));
    }
    return word;
}

Hash256 EncodeBool(bool value) {
    return EncodeUint256(value ? 1 : 0);
}

Hash256 EncodeAddress(const Address& address) {
    Hash256 word;
    std::copy(address.begin(), address.end(),
              word.begin() + (Hash256::SIZE - Address::SIZE));
    return word;
}

// ============================================================================
// Digests
// ============================================================================

Hash256 ComputeDomainSeparator(const std::string& name, uint64_t chainId,
                               const Address& contract) {
    Hash256 result;
    Keccak256()
        .Write(DomainTypeHash())
        .Write(Keccak256Hash(name))
        .Write(EncodeUint256(chainId))
        .Write(EncodeAddress(contract))
        .Finalize(result.data());
    return result;
}

Hash256 ComputeBallotStructHash(ProposalId id, bool support) {
    Hash256 result;
    Keccak256()
        .Write(BallotTypeHash())
        .Write(EncodeUint256(id))
        .Write(EncodeBool(support))
        .Finalize(result.data());
    return result;
}

Hash256 ComputeBallotDigest(const Hash256& domainSeparator, ProposalId id, bool support) {
    static const Byte prefix[2] = {0x19, 0x01};

    Hash256 result;
    Keccak256()
        .Write(prefix, sizeof(prefix))
        .Write(domainSeparator)
        .Write(ComputeBallotStructHash(id, support))
        .Finalize(result.data());
    return result;
}

// ============================================================================
// EcdsaSignatureVerifier
// ============================================================================

std::optional<Address> EcdsaSignatureVerifier::Recover(const Hash256& digest,
                                                       const std::vector<Byte>& signature) const {
    auto pubkey = PublicKey::RecoverCompact(digest, signature);
    if (!pubkey) {
        LOG_DEBUG(util::LogCategory::CRYPTO) << "Signature does not recover over "
                                             << digest.ToHex();
        return std::nullopt;
    }

    Address signer = pubkey->GetAddress();
    if (signer.IsNull()) {
        return std::nullopt;
    }
    return signer;
}

} // namespace governance
} // namespace quorum
