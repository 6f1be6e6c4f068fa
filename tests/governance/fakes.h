// QUORUM - In-memory governance collaborators for tests
// Copyright (c) 2024 QUORUM Developers
// MIT License

#ifndef QUORUM_TESTS_GOVERNANCE_FAKES_H
#define QUORUM_TESTS_GOVERNANCE_FAKES_H

#include <quorum/governance/governance.h>

#include <array>
#include <functional>
#include <iterator>
#include <map>
#include <optional>
#include <vector>

namespace quorum {
namespace test {

/**
 * Voting weights recorded as (account, fromCheckpoint) -> weight.
 * The weight at checkpoint c is the last value set at or before c.
 */
class FakeWeightOracle : public governance::IVotingWeightOracle {
public:
    explicit FakeWeightOracle(Weight totalSupply) : totalSupply_(totalSupply) {}

    void SetVotes(const Address& account, Checkpoint from, Weight weight) {
        history_[account][from] = weight;
    }

    void SetTotalSupply(Weight totalSupply) { totalSupply_ = totalSupply; }

    Weight GetTotalSupply() const override { return totalSupply_; }

    Weight GetPriorVotes(const Address& account, Checkpoint checkpoint) const override {
        ++lookups_;
        if (onLookup) {
            onLookup();
        }
        auto it = history_.find(account);
        if (it == history_.end()) {
            return 0;
        }
        auto point = it->second.upper_bound(checkpoint);
        if (point == it->second.begin()) {
            return 0;
        }
        return std::prev(point)->second;
    }

    size_t LookupCount() const { return lookups_; }

    /// Runs inside GetPriorVotes when set
    std::function<void()> onLookup;

private:
    Weight totalSupply_;
    std::map<Address, std::map<Checkpoint, Weight>> history_;
    mutable size_t lookups_{0};
};

/**
 * Records every call; fails the call at `failAt` if set.
 */
class FakeActionExecutor : public governance::IActionExecutor {
public:
    struct Call {
        Address target;
        std::vector<Byte> callData;
    };

    governance::ActionResult Invoke(const Address& target,
                                    const std::vector<Byte>& callData) override {
        size_t index = calls.size();
        calls.push_back({target, callData});
        if (onInvoke) {
            onInvoke();
        }

        governance::ActionResult result;
        if (failAt && *failAt == index) {
            result.success = false;
            result.error = "execution reverted";
            return result;
        }
        result.success = true;
        result.returnData = {0x01};
        return result;
    }

    std::vector<Call> calls;
    std::optional<size_t> failAt;

    /// Runs inside Invoke when set
    std::function<void()> onInvoke;
};

/**
 * Maps exact signature bytes to a signer and remembers the last digest.
 */
class FakeSignatureVerifier : public governance::ISignatureVerifier {
public:
    void AddSigner(const std::vector<Byte>& signature, const Address& signer) {
        signers_[signature] = signer;
    }

    std::optional<Address> Recover(const Hash256& digest,
                                   const std::vector<Byte>& signature) const override {
        lastDigest = digest;
        auto it = signers_.find(signature);
        if (it == signers_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    mutable Hash256 lastDigest;

private:
    std::map<std::vector<Byte>, Address> signers_;
};

/// Address with the given last byte
inline Address MakeAddress(Byte id) {
    Address address;
    address[Address::SIZE - 1] = id;
    return address;
}

} // namespace test
} // namespace quorum

#endif // QUORUM_TESTS_GOVERNANCE_FAKES_H
