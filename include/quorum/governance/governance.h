// QUORUM - Governance Module
// Copyright (c) 2024 QUORUM Developers
// MIT License
//
// Quorum-based governance engine.
//
// Token-weighted stakeholders propose a batch of external actions, vote on
// the batch over a bounded window, and the batch is executed only if quorum
// and majority thresholds are met before the proposal's lifetime expires.
//
// Key features:
// - Proposal lifecycle computed from the current checkpoint
// - Voting weight fixed at the proposal's start checkpoint
// - Direct and signed (typed-data) ballots
// - Cancellation of proposers who fall below the threshold
// - Ordered execution of batched actions, stopping at the first failure

#ifndef QUORUM_GOVERNANCE_GOVERNANCE_H
#define QUORUM_GOVERNANCE_GOVERNANCE_H

#include <quorum/core/types.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace quorum {

namespace util {
class ConfigManager;
}

namespace governance {

// ============================================================================
// Governance Constants
// ============================================================================

/// Checkpoints between proposal creation and the start of voting
constexpr Checkpoint VOTING_DELAY = 1;

/// Hard upper bound on proposalMaxOperations
constexpr size_t MAX_PROPOSAL_OPERATIONS = 10;

/// Size of a function selector prefix
constexpr size_t SELECTOR_SIZE = 4;

// ============================================================================
// Governance Types
// ============================================================================

/// Sequential proposal identifier, starting at 1 (0 means "none")
using ProposalId = uint64_t;

/// Lifecycle state of a proposal
enum class ProposalState {
    /// Created, voting not yet open
    Pending,

    /// Voting window open
    Active,

    /// Canceled after the proposer lost standing
    Canceled,

    /// Voting closed without majority or quorum
    Defeated,

    /// Voting closed with majority and quorum, awaiting execution
    Succeeded,

    /// Succeeded but not executed before the lifetime ended
    Expired,

    /// Actions executed
    Executed,

    /// No state applies
    Null
};

/// Convert state to string
const char* ProposalStateToString(ProposalState state);
/// Parse state from string, ignoring case
/// Parse state from string
std::optional<ProposalState> ParseProposalState(const std::string& str);

// ============================================================================
// Errors
// ============================================================================

/// Failure kinds reported by the engine
enum class GovernanceErrorCode {
    InvalidConfiguration,
    InsufficientWeight,
    MalformedProposal,
    ConflictingProposal,
    InvalidProposalId,
    InvalidState,
    DuplicateVote,
    InvalidSignature,
    ArithmeticOverflow,
    ArithmeticUnderflow,
    ActionExecutionFailed
};

/// Convert error code to string
const char* GovernanceErrorCodeToString(GovernanceErrorCode code);

/**
 * Exception thrown by every failing governance operation.
 *
 * A precondition failure leaves the engine unchanged. ActionExecutionFailed
 * is the one exception: the proposal stays marked executed and the actions
 * before the failing one are not undone.
 */
class GovernanceError : public std::runtime_error {
public:
    GovernanceError(GovernanceErrorCode code, const std::string& msg);

    /// ActionExecutionFailed at the given action index
    GovernanceError(size_t actionIndex, const std::string& msg);

    GovernanceErrorCode GetCode() const { return code_; }

    /// Index of the failing action, for ActionExecutionFailed
    std::optional<size_t> GetActionIndex() const { return actionIndex_; }

private:
    GovernanceErrorCode code_;
    std::optional<size_t> actionIndex_;
};

// ============================================================================
// Proposal Data
// ============================================================================

/**
 * One external call in a proposal batch.
 */
struct Action {
    /// Callee
    Address target;

    /// Function signature, e.g. "transfer(address,uint256)"; may be empty
    std::string signature;

    /// Opaque argument bytes
    std::vector<Byte> payload;

    /// Bytes handed to the executor: selector || payload when a signature
    /// is present, the payload verbatim otherwise
    std::vector<Byte> GetCallData() const;

    bool operator==(const Action& other) const {
        return target == other.target && signature == other.signature &&
               payload == other.payload;
    }
};

/**
 * Parallel action lists, as passed to Propose and returned by GetActions.
 */
struct ProposalActions {
    std::vector<Address> targets;
    std::vector<std::string> signatures;
    std::vector<std::vector<Byte>> payloads;

    size_t size() const { return targets.size(); }
};

/**
 * A voter's participation in one proposal. Immutable once recorded.
 */
struct Receipt {
    bool hasVoted{false};
    bool support{false};
    Weight votes{0};
};

/**
 * Stored proposal record.
 */
struct Proposal {
    ProposalId id{0};
    Address proposer;
    std::vector<Action> actions;

    /// Voting opens after this checkpoint
    Checkpoint startBlock{0};

    /// Voting closes after this checkpoint
    Checkpoint voteEndBlock{0};

    /// A succeeded proposal expires at this checkpoint
    Checkpoint lifetimeEndBlock{0};

    Weight forVotes{0};
    Weight againstVotes{0};
    bool canceled{false};
    bool executed{false};

    /// Receipts by voter
    std::map<Address, Receipt> receipts;

    /// Split actions into parallel lists
    ProposalActions GetActions() const;

    /// Receipt for a voter; the default receipt if they never voted
    Receipt GetReceipt(const Address& voter) const;
};

/**
 * Compute a proposal's state at checkpoint `now`.
 *
 * Rules are applied in order: canceled, pending, active, defeated,
 * executed, expired, succeeded.
 */
ProposalState ComputeProposalState(const Proposal& proposal, Checkpoint now,
                                   Weight quorumVotes);

// ============================================================================
// Configuration
// ============================================================================

/**
 * Engine configuration, fixed at construction.
 */
struct GovernanceConfig {
    /// Name bound into the signing domain
    std::string name;

    /// Minimum for-votes for success
    Weight quorumVotes{0};

    /// Weight a proposer must exceed
    Weight proposalThreshold{0};

    /// Actions allowed per proposal (1..MAX_PROPOSAL_OPERATIONS)
    size_t proposalMaxOperations{MAX_PROPOSAL_OPERATIONS};

    /// Checkpoints the vote stays open
    Checkpoint votingPeriod{0};

    /// Checkpoints from vote start until a proposal expires
    Checkpoint proposalLifetime{0};

    /// Reference token (informational)
    Address token;

    /// Chain identity bound into the signing domain
    uint64_t chainId{1};

    /// This engine's identity, bound into the signing domain
    Address contract;

    /**
     * Check every bound against the token's total supply.
     * @throws GovernanceError (InvalidConfiguration)
     */
    void Validate(Weight totalSupply) const;

    /**
     * Read a configuration from a [governance] style section.
     *
     * Required: name, quorumvotes, proposalthreshold, votingperiod,
     * proposallifetime. Optional: proposalmaxoperations, token, chainid,
     * contract.
     *
     * @throws GovernanceError (InvalidConfiguration) on missing or
     *         unparseable keys
     */
    static GovernanceConfig FromConfig(const util::ConfigManager& config,
                                       const std::string& section = "governance");
};

// ============================================================================
// Collaborators
// ============================================================================

/**
 * Source of token-weighted voting power.
 */
class IVotingWeightOracle {
public:
    virtual ~IVotingWeightOracle() = default;

    /// Current total token supply
    virtual Weight GetTotalSupply() const = 0;

    /// Voting weight an account held at a past checkpoint
    virtual Weight GetPriorVotes(const Address& account, Checkpoint checkpoint) const = 0;
};

/// Outcome of one external call
struct ActionResult {
    bool success{false};
    std::vector<Byte> returnData;
    std::string error;
};

/**
 * Performs external calls on behalf of executed proposals.
 */
class IActionExecutor {
public:
    virtual ~IActionExecutor() = default;

    /// Perform one call; never retried by the engine. A thrown exception
    /// counts as a failed call.
    virtual ActionResult Invoke(const Address& target, const std::vector<Byte>& callData) = 0;
};

/**
 * Recovers the signer of a typed-data digest.
 */
class ISignatureVerifier {
public:
    virtual ~ISignatureVerifier() = default;

    /// Signer address, or nullopt if the signature is invalid
    virtual std::optional<Address> Recover(const Hash256& digest,
                                           const std::vector<Byte>& signature) const = 0;
};

// ============================================================================
// Events
// ============================================================================

struct ProposalCreatedEvent {
    ProposalId id{0};
    Address proposer;
    std::vector<Action> actions;
    Checkpoint startBlock{0};
    Checkpoint voteEndBlock{0};
    Checkpoint lifetimeEndBlock{0};
    std::string description;
};

struct VoteCastEvent {
    Address voter;
    ProposalId id{0};
    bool support{false};
    Weight votes{0};
};

struct ProposalCanceledEvent {
    ProposalId id{0};
};

struct ProposalExecutedEvent {
    ProposalId id{0};
};

/// Any record emitted for external indexers
using GovernanceEvent = std::variant<ProposalCreatedEvent, VoteCastEvent,
                                     ProposalCanceledEvent, ProposalExecutedEvent>;

// ============================================================================
// Governance Engine
// ============================================================================

/**
 * Owns the configuration, the proposal registry and the latest-proposal
 * index. Every public operation runs under one mutex.
 *
 * Collaborators are called while the engine is locked and must not call
 * back into it; such calls fail with InvalidState. Events are delivered
 * after the lock is released.
 */
class GovernanceEngine {
public:
    /// Callback for emitted events
    using EventCallback = std::function<void(const GovernanceEvent&)>;

    /**
     * @throws GovernanceError (InvalidConfiguration) for out-of-range
     *         values or a missing collaborator
     */
    GovernanceEngine(GovernanceConfig config,
                     std::shared_ptr<IVotingWeightOracle> oracle,
                     std::shared_ptr<IActionExecutor> executor,
                     std::shared_ptr<ISignatureVerifier> verifier);
    ~GovernanceEngine();

    GovernanceEngine(const GovernanceEngine&) = delete;
    GovernanceEngine& operator=(const GovernanceEngine&) = delete;

    // === Proposals ===

    /// Create a proposal and return its id
    ProposalId Propose(const Address& proposer,
                       const std::vector<Address>& targets,
                       const std::vector<std::string>& signatures,
                       const std::vector<std::vector<Byte>>& payloads,
                       const std::string& description);

    /// Cancel a proposal whose proposer fell below the threshold
    void Cancel(const Address& caller, ProposalId id);

    /// Execute a succeeded proposal's actions in order
    void Execute(const Address& caller, ProposalId id);

    // === Voting ===

    /// Vote as `voter`
    void CastVote(const Address& voter, ProposalId id, bool support);

    /// Vote with a signed ballot; returns the recovered voter
    Address CastVoteBySig(ProposalId id, bool support, const std::vector<Byte>& signature);

    // === Queries ===

    ProposalState GetState(ProposalId id) const;
    ProposalActions GetActions(ProposalId id) const;
    Receipt GetReceipt(ProposalId id, const Address& voter) const;
    Proposal GetProposal(ProposalId id) const;

    /// Number of proposals ever created
    uint64_t GetProposalCount() const;

    /// Most recent proposal by `proposer`, or 0
    ProposalId GetLatestProposalId(const Address& proposer) const;

    const GovernanceConfig& GetConfig() const { return config_; }

    /// Typed-data domain separator for off-chain ballot signers
    const Hash256& GetDomainSeparator() const { return domainSeparator_; }

    // === Lifecycle ===

    /// Advance the clock; heights may not go backwards
    void ProcessBlock(Checkpoint height);

    Checkpoint GetCurrentHeight() const;

    // === Callbacks ===

    void SetEventCallback(EventCallback callback);

private:
    /// Holds mutex_ and records the owning thread
    class EngineLock {
    public:
        explicit EngineLock(const GovernanceEngine& engine);
        ~EngineLock();

        EngineLock(const EngineLock&) = delete;
        EngineLock& operator=(const EngineLock&) = delete;

    private:
        const GovernanceEngine& engine_;
    };

    /// Shared voting routine
    VoteCastEvent CastVoteLocked(const Address& voter, ProposalId id, bool support);

    const Proposal& GetProposalLocked(ProposalId id) const;
    Proposal& GetProposalLocked(ProposalId id);

    ProposalState GetStateLocked(const Proposal& proposal) const;

    /// now - 1, the checkpoint for proposer standing
    Checkpoint PreviousCheckpoint() const;

    /// Deliver events outside the lock
    void Emit(const EventCallback& callback, const std::vector<GovernanceEvent>& events) const;

    GovernanceConfig config_;
    std::shared_ptr<IVotingWeightOracle> oracle_;
    std::shared_ptr<IActionExecutor> executor_;
    std::shared_ptr<ISignatureVerifier> verifier_;
    Hash256 domainSeparator_;

    mutable std::mutex mutex_;
    mutable std::atomic<std::thread::id> lockOwner_{};

    // Storage
    std::vector<Proposal> proposals_;
    std::map<Address, ProposalId> latestProposalIds_;

    // State
    Checkpoint currentHeight_{0};

    EventCallback eventCallback_;
};

} // namespace governance
} // namespace quorum

#endif // QUORUM_GOVERNANCE_GOVERNANCE_H
