// QUORUM - Typed-Data Ballots
// Copyright (c) 2024 QUORUM Developers
// MIT License
//
// EIP-712 compatible digests for signed ballots:
//
//   domainSeparator = keccak(DOMAIN_TYPEHASH || keccak(name) || chainId || contract)
//   structHash      = keccak(BALLOT_TYPEHASH || proposalId || support)
//   digest          = keccak(0x19 0x01 || domainSeparator || structHash)
//
// Every field is a 32-byte big-endian ABI word.

#ifndef QUORUM_GOVERNANCE_TYPED_DATA_H
#define QUORUM_GOVERNANCE_TYPED_DATA_H

#include <quorum/core/types.h>
#include <quorum/governance/governance.h>

#include <optional>
#include <string>
#include <vector>

namespace quorum {
namespace governance {

/// Domain type string
constexpr const char* DOMAIN_TYPE =
    "EIP712Domain(string name,uint256 chainId,address verifyingContract)";

/// Ballot type string
constexpr const char* BALLOT_TYPE = "Ballot(uint256 proposalId,bool support)";

/// keccak(DOMAIN_TYPE)
const Hash256& DomainTypeHash();

/// keccak(BALLOT_TYPE)
const Hash256& BallotTypeHash();

// ============================================================================
// ABI Words
// ============================================================================

Hash256 EncodeUint256(uint64_t value);
Hash256 EncodeBool(bool value);

/// Address left-padded with zeros
Hash256 EncodeAddress(const Address& address);

// ============================================================================
// Digests
// ============================================================================

Hash256 ComputeDomainSeparator(const std::string& name, uint64_t chainId,
                               const Address& contract);

Hash256 ComputeBallotStructHash(ProposalId id, bool support);

/// Digest a ballot signer signs
Hash256 ComputeBallotDigest(const Hash256& domainSeparator, ProposalId id, bool support);

// ============================================================================
// Signature Verifier
// ============================================================================

/**
 * ISignatureVerifier over secp256k1 compact signatures (r || s || v).
 * Signatures that do not recover, or recover to the zero address, yield
 * nullopt.
 */
class EcdsaSignatureVerifier : public ISignatureVerifier {
public:
    std::optional<Address> Recover(const Hash256& digest,
                                   const std::vector<Byte>& signature) const override;
};

} // namespace governance
} // namespace quorum

#endif // QUORUM_GOVERNANCE_TYPED_DATA_H
