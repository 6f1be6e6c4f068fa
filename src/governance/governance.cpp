// QUORUM - Governance Module Implementation
// Copyright (c) 2024 QUORUM Developers
// MIT License

#include <quorum/governance/governance.h>
#include <quorum/governance/typed_data.h>
#include <quorum/crypto/keccak.h>
#include <quorum/util/config.h>
#include <quorum/util/logging.h>

#include <algorithm>
#include <cctype>
#include <exception>
#include <sstream>

namespace quorum {
namespace governance {

namespace LogCategory = util::LogCategory;

// ============================================================================
// String Conversion Functions
// ============================================================================

const char* ProposalStateToString(ProposalState state) {
    switch (state) {
        case ProposalState::Pending: return "Pending";
        case ProposalState::Active: return "Active";
        case ProposalState::Canceled: return "Canceled";
        case ProposalState::Defeated: return "Defeated";
        case ProposalState::Succeeded: return "Succeeded";
        case ProposalState::Expired: return "Expired";
        case ProposalState::Executed: return "Executed";
        case ProposalState::Null: return "Null";
        default: return "Unknown";
    }
}

std::optional<ProposalState> ParseProposalState(const std::string& str) {
    std::string name = str;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (name == "pending") return ProposalState::Pending;
    if (name == "active") return ProposalState::Active;
    if (name == "canceled") return ProposalState::Canceled;
    if (name == "defeated") return ProposalState::Defeated;
    if (name == "succeeded") return ProposalState::Succeeded;
    if (name == "expired") return ProposalState::Expired;
    if (name == "executed") return ProposalState::Executed;
    if (name == "null") return ProposalState::Null;
    return std::nullopt;
}

const char* GovernanceErrorCodeToString(GovernanceErrorCode code) {
    switch (code) {
        case GovernanceErrorCode::InvalidConfiguration: return "InvalidConfiguration";
        case GovernanceErrorCode::InsufficientWeight: return "InsufficientWeight";
        case GovernanceErrorCode::MalformedProposal: return "MalformedProposal";
        case GovernanceErrorCode::ConflictingProposal: return "ConflictingProposal";
        case GovernanceErrorCode::InvalidProposalId: return "InvalidProposalId";
        case GovernanceErrorCode::InvalidState: return "InvalidState";
        case GovernanceErrorCode::DuplicateVote: return "DuplicateVote";
        case GovernanceErrorCode::InvalidSignature: return "InvalidSignature";
        case GovernanceErrorCode::ArithmeticOverflow: return "ArithmeticOverflow";
        case GovernanceErrorCode::ArithmeticUnderflow: return "ArithmeticUnderflow";
        case GovernanceErrorCode::ActionExecutionFailed: return "ActionExecutionFailed";
        default: return "Unknown";
    }
}

// ============================================================================
// GovernanceError
// ============================================================================

GovernanceError::GovernanceError(GovernanceErrorCode code, const std::string& msg)
    : std::runtime_error(std::string(GovernanceErrorCodeToString(code)) + ": " + msg)
    , code_(code) {}

GovernanceError::GovernanceError(size_t actionIndex, const std::string& msg)
    : std::runtime_error("ActionExecutionFailed: action " + std::to_string(actionIndex) +
                         ": " + msg)
    , code_(GovernanceErrorCode::ActionExecutionFailed)
    , actionIndex_(actionIndex) {}

namespace {

/// Log the rejection and throw
[[noreturn]] void Reject(GovernanceErrorCode code, const std::string& msg) {
    LOG_DEBUG(LogCategory::GOVERNANCE) << "Rejected (" << GovernanceErrorCodeToString(code)
                                       << "): " << msg;
    throw GovernanceError(code, msg);
}

Checkpoint AddCheckpoints(Checkpoint a, Checkpoint b) {
    auto sum = AddChecked(a, b);
    if (!sum) {
        Reject(GovernanceErrorCode::ArithmeticOverflow, "checkpoint addition overflows");
    }
    return *sum;
}

} // anonymous namespace

// ============================================================================
// Action / Proposal
// ============================================================================

std::vector<Byte> Action::GetCallData() const {
    if (signature.empty()) {
        return payload;
    }

    auto selector = FunctionSelector(signature);
    std::vector<Byte> callData;
    callData.reserve(SELECTOR_SIZE + payload.size());
    callData.insert(callData.end(), selector.begin(), selector.end());
    callData.insert(callData.end(), payload.begin(), payload.end());
    return callData;
}

ProposalActions Proposal::GetActions() const {
    ProposalActions result;
    result.targets.reserve(actions.size());
    result.signatures.reserve(actions.size());
    result.payloads.reserve(actions.size());
    for (const auto& action : actions) {
        result.targets.push_back(action.target);
        result.signatures.push_back(action.signature);
        result.payloads.push_back(action.payload);
    }
    return result;
}

Receipt Proposal::GetReceipt(const Address& voter) const {
    auto it = receipts.find(voter);
    if (it == receipts.end()) {
        return Receipt{};
    }
    return it->second;
}

ProposalState ComputeProposalState(const Proposal& proposal, Checkpoint now,
                                   Weight quorumVotes) {
    if (proposal.canceled) {
        return ProposalState::Canceled;
    }
    if (now <= proposal.startBlock) {
        return ProposalState::Pending;
    }
    if (now <= proposal.voteEndBlock) {
        return ProposalState::Active;
    }
    if (proposal.forVotes <= proposal.againstVotes || proposal.forVotes < quorumVotes) {
        return ProposalState::Defeated;
    }
    if (proposal.executed) {
        return ProposalState::Executed;
    }
    if (now >= proposal.lifetimeEndBlock) {
        return ProposalState::Expired;
    }
    if (proposal.forVotes > proposal.againstVotes && proposal.forVotes >= quorumVotes) {
        return ProposalState::Succeeded;
    }
    return ProposalState::Null;
}

// ============================================================================
// GovernanceConfig
// ============================================================================

void GovernanceConfig::Validate(Weight totalSupply) const {
    auto invalid = [](const std::string& msg) {
        throw GovernanceError(GovernanceErrorCode::InvalidConfiguration, msg);
    };

    if (name.empty()) {
        invalid("name must not be empty");
    }
    if (quorumVotes == 0 || quorumVotes >= totalSupply) {
        invalid("quorumVotes must be in (0, totalSupply)");
    }
    if (proposalThreshold == 0 || proposalThreshold >= totalSupply) {
        invalid("proposalThreshold must be in (0, totalSupply)");
    }
    if (proposalMaxOperations == 0 || proposalMaxOperations > MAX_PROPOSAL_OPERATIONS) {
        invalid("proposalMaxOperations must be in [1, " +
                std::to_string(MAX_PROPOSAL_OPERATIONS) + "]");
    }
    if (votingPeriod == 0) {
        invalid("votingPeriod must be positive");
    }
    if (proposalLifetime <= votingPeriod) {
        invalid("proposalLifetime must exceed votingPeriod");
    }
}

GovernanceConfig GovernanceConfig::FromConfig(const util::ConfigManager& config,
                                              const std::string& section) {
    namespace keys = util::ConfigKeys;

    auto requireUInt = [&](const char* key) -> uint64_t {
        if (!config.HasKey(key, section)) {
            throw GovernanceError(GovernanceErrorCode::InvalidConfiguration,
                                  "missing [" + section + "] " + key);
        }
        auto value = config.TryGetUInt(key, section);
        if (!value) {
            throw GovernanceError(GovernanceErrorCode::InvalidConfiguration,
                                  "[" + section + "] " + key + " is not an unsigned integer");
        }
        return *value;
    };

    auto optionalAddress = [&](const char* key) -> Address {
        auto str = config.TryGetString(key, section);
        if (!str || str->empty()) {
            return Address();
        }
        try {
            return Address::FromHex(*str);
        } catch (const std::invalid_argument& e) {
            throw GovernanceError(GovernanceErrorCode::InvalidConfiguration,
                                  "[" + section + "] " + key + ": " + e.what());
        }
    };

    GovernanceConfig result;

    auto name = config.TryGetString(keys::NAME, section);
    if (!name) {
        throw GovernanceError(GovernanceErrorCode::InvalidConfiguration,
                              "missing [" + section + "] " + keys::NAME);
    }
    result.name = *name;
    result.quorumVotes = requireUInt(keys::QUORUMVOTES);
    result.proposalThreshold = requireUInt(keys::PROPOSALTHRESHOLD);
    result.votingPeriod = requireUInt(keys::VOTINGPERIOD);
    result.proposalLifetime = requireUInt(keys::PROPOSALLIFETIME);

    if (config.HasKey(keys::PROPOSALMAXOPERATIONS, section)) {
        result.proposalMaxOperations =
            static_cast<size_t>(requireUInt(keys::PROPOSALMAXOPERATIONS));
    }
    if (config.HasKey(keys::CHAINID, section)) {
        result.chainId = requireUInt(keys::CHAINID);
    }
    result.token = optionalAddress(keys::TOKEN);
    result.contract = optionalAddress(keys::CONTRACT);

    return result;
}

// ============================================================================
// GovernanceEngine Lock
// ============================================================================

GovernanceEngine::EngineLock::EngineLock(const GovernanceEngine& engine)
    : engine_(engine) {
    if (engine_.lockOwner_.load() == std::this_thread::get_id()) {
        throw GovernanceError(GovernanceErrorCode::InvalidState,
                              "re-entrant call into the governance engine");
    }
    engine_.mutex_.lock();
    engine_.lockOwner_.store(std::this_thread::get_id());
}

GovernanceEngine::EngineLock::~EngineLock() {
    engine_.lockOwner_.store(std::thread::id());
    engine_.mutex_.unlock();
}

// ============================================================================
// GovernanceEngine Implementation
// ============================================================================

GovernanceEngine::GovernanceEngine(GovernanceConfig config,
                                   std::shared_ptr<IVotingWeightOracle> oracle,
                                   std::shared_ptr<IActionExecutor> executor,
                                   std::shared_ptr<ISignatureVerifier> verifier)
    : config_(std::move(config))
    , oracle_(std::move(oracle))
    , executor_(std::move(executor))
    , verifier_(std::move(verifier)) {
    if (!oracle_ || !executor_ || !verifier_) {
        throw GovernanceError(GovernanceErrorCode::InvalidConfiguration,
                              "oracle, executor and verifier are required");
    }

    config_.Validate(oracle_->GetTotalSupply());
    domainSeparator_ = ComputeDomainSeparator(config_.name, config_.chainId, config_.contract);

    LogInfoF(LogCategory::GOVERNANCE,
             "Governance '%s' ready: quorum=%llu threshold=%llu maxOps=%zu "
             "votingPeriod=%llu lifetime=%llu",
             config_.name.c_str(),
             static_cast<unsigned long long>(config_.quorumVotes),
             static_cast<unsigned long long>(config_.proposalThreshold),
             config_.proposalMaxOperations,
             static_cast<unsigned long long>(config_.votingPeriod),
             static_cast<unsigned long long>(config_.proposalLifetime));
}

GovernanceEngine::~GovernanceEngine() = default;

Checkpoint GovernanceEngine::PreviousCheckpoint() const {
    auto previous = SubChecked(currentHeight_, 1);
    if (!previous) {
        Reject(GovernanceErrorCode::ArithmeticUnderflow,
               "no checkpoint precedes height 0");
    }
    return *previous;
}

const Proposal& GovernanceEngine::GetProposalLocked(ProposalId id) const {
    if (id == 0 || id > proposals_.size()) {
        Reject(GovernanceErrorCode::InvalidProposalId,
               "proposal " + std::to_string(id) + " does not exist");
    }
    return proposals_[id - 1];
}

Proposal& GovernanceEngine::GetProposalLocked(ProposalId id) {
    return const_cast<Proposal&>(
        static_cast<const GovernanceEngine&>(*this).GetProposalLocked(id));
}

ProposalState GovernanceEngine::GetStateLocked(const Proposal& proposal) const {
    return ComputeProposalState(proposal, currentHeight_, config_.quorumVotes);
}

void GovernanceEngine::Emit(const EventCallback& callback,
                            const std::vector<GovernanceEvent>& events) const {
    if (!callback) {
        return;
    }
    for (const auto& event : events) {
        callback(event);
    }
}

// === Proposals ===

ProposalId GovernanceEngine::Propose(const Address& proposer,
                                     const std::vector<Address>& targets,
                                     const std::vector<std::string>& signatures,
                                     const std::vector<std::vector<Byte>>& payloads,
                                     const std::string& description) {
    EventCallback callback;
    std::vector<GovernanceEvent> events;
    ProposalId id = 0;

    {
        EngineLock lock(*this);

        Weight weight = oracle_->GetPriorVotes(proposer, PreviousCheckpoint());
        if (weight <= config_.proposalThreshold) {
            Reject(GovernanceErrorCode::InsufficientWeight,
                   "proposer " + proposer.ToString() + " has " + std::to_string(weight) +
                   ", needs more than " + std::to_string(config_.proposalThreshold));
        }

        if (targets.size() != signatures.size() || targets.size() != payloads.size()) {
            Reject(GovernanceErrorCode::MalformedProposal, "action list lengths differ");
        }
        if (targets.empty()) {
            Reject(GovernanceErrorCode::MalformedProposal, "no actions");
        }
        if (targets.size() > config_.proposalMaxOperations) {
            Reject(GovernanceErrorCode::MalformedProposal,
                   "too many actions: " + std::to_string(targets.size()));
        }

        auto latest = latestProposalIds_.find(proposer);
        if (latest != latestProposalIds_.end()) {
            ProposalState latestState = GetStateLocked(GetProposalLocked(latest->second));
            if (latestState == ProposalState::Active || latestState == ProposalState::Pending) {
                Reject(GovernanceErrorCode::ConflictingProposal,
                       "proposer already has proposal " + std::to_string(latest->second) +
                       " " + ProposalStateToString(latestState));
            }
        }

        Proposal proposal;
        proposal.id = proposals_.size() + 1;
        proposal.proposer = proposer;
        proposal.startBlock = AddCheckpoints(currentHeight_, VOTING_DELAY);
        proposal.voteEndBlock = AddCheckpoints(proposal.startBlock, config_.votingPeriod);
        proposal.lifetimeEndBlock = AddCheckpoints(proposal.startBlock, config_.proposalLifetime);

        proposal.actions.reserve(targets.size());
        for (size_t i = 0; i < targets.size(); ++i) {
            proposal.actions.push_back(Action{targets[i], signatures[i], payloads[i]});
        }

        ProposalCreatedEvent event;
        event.id = proposal.id;
        event.proposer = proposer;
        event.actions = proposal.actions;
        event.startBlock = proposal.startBlock;
        event.voteEndBlock = proposal.voteEndBlock;
        event.lifetimeEndBlock = proposal.lifetimeEndBlock;
        event.description = description;

        id = proposal.id;
        proposals_.push_back(std::move(proposal));
        latestProposalIds_[proposer] = id;

        LOG_INFO(LogCategory::GOVERNANCE) << "Proposal " << id << " created by "
                                          << proposer.ToString() << " with "
                                          << targets.size() << " action(s), voting "
                                          << event.startBlock << "-" << event.voteEndBlock;

        events.emplace_back(std::move(event));
        callback = eventCallback_;
    }

    Emit(callback, events);
    return id;
}

void GovernanceEngine::Cancel(const Address& caller, ProposalId id) {
    EventCallback callback;

    {
        EngineLock lock(*this);

        Proposal& proposal = GetProposalLocked(id);
        if (GetStateLocked(proposal) == ProposalState::Executed) {
            Reject(GovernanceErrorCode::InvalidState,
                   "proposal " + std::to_string(id) + " already executed");
        }

        Weight weight = oracle_->GetPriorVotes(proposal.proposer, PreviousCheckpoint());
        if (weight >= config_.proposalThreshold) {
            Reject(GovernanceErrorCode::InsufficientWeight,
                   "proposer " + proposal.proposer.ToString() + " still holds " +
                   std::to_string(weight));
        }

        proposal.canceled = true;
        LOG_INFO(LogCategory::GOVERNANCE) << "Proposal " << id << " canceled by "
                                          << caller.ToString();
        callback = eventCallback_;
    }

    Emit(callback, {ProposalCanceledEvent{id}});
}

void GovernanceEngine::Execute(const Address& caller, ProposalId id) {
    EventCallback callback;

    {
        EngineLock lock(*this);

        Proposal& proposal = GetProposalLocked(id);
        ProposalState state = GetStateLocked(proposal);
        if (state != ProposalState::Succeeded) {
            Reject(GovernanceErrorCode::InvalidState,
                   "proposal " + std::to_string(id) + " is " + ProposalStateToString(state));
        }

        proposal.executed = true;
        LOG_INFO(LogCategory::EXECUTION) << "Executing proposal " << id << " ("
                                         << proposal.actions.size() << " action(s)) for "
                                         << caller.ToString();

        for (size_t i = 0; i < proposal.actions.size(); ++i) {
            const Action& action = proposal.actions[i];
            ActionResult result;
            try {
                result = executor_->Invoke(action.target, action.GetCallData());
            } catch (const std::exception& e) {
                LOG_WARN(LogCategory::EXECUTION) << "Proposal " << id << " action " << i
                                                 << " to " << action.target.ToString()
                                                 << " threw: " << e.what();
                throw GovernanceError(i, e.what());
            }
            if (!result.success) {
                LOG_WARN(LogCategory::EXECUTION) << "Proposal " << id << " action " << i
                                                 << " to " << action.target.ToString()
                                                 << " failed: " << result.error;
                throw GovernanceError(i, result.error.empty() ? "call reverted" : result.error);
            }
            LOG_DEBUG(LogCategory::EXECUTION) << "Proposal " << id << " action " << i
                                              << " returned " << result.returnData.size()
                                              << " byte(s)";
        }

        LOG_INFO(LogCategory::EXECUTION) << "Proposal " << id << " executed";
        callback = eventCallback_;
    }

    Emit(callback, {ProposalExecutedEvent{id}});
}

// === Voting ===

VoteCastEvent GovernanceEngine::CastVoteLocked(const Address& voter, ProposalId id,
                                               bool support) {
    Proposal& proposal = GetProposalLocked(id);

    ProposalState state = GetStateLocked(proposal);
    if (state != ProposalState::Active) {
        Reject(GovernanceErrorCode::InvalidState,
               "voting on proposal " + std::to_string(id) + " is closed (" +
               ProposalStateToString(state) + ")");
    }

    if (proposal.receipts.count(voter) > 0) {
        Reject(GovernanceErrorCode::DuplicateVote,
               voter.ToString() + " already voted on proposal " + std::to_string(id));
    }

    Weight votes = oracle_->GetPriorVotes(voter, proposal.startBlock);

    Weight& tally = support ? proposal.forVotes : proposal.againstVotes;
    auto newTally = AddChecked(tally, votes);
    if (!newTally) {
        Reject(GovernanceErrorCode::ArithmeticOverflow, "vote tally overflows");
    }

    tally = *newTally;
    proposal.receipts[voter] = Receipt{true, support, votes};

    LOG_INFO(LogCategory::VOTING) << voter.ToString() << " voted "
                                  << (support ? "for" : "against") << " proposal " << id
                                  << " with " << votes;

    return VoteCastEvent{voter, id, support, votes};
}

void GovernanceEngine::CastVote(const Address& voter, ProposalId id, bool support) {
    EventCallback callback;
    std::vector<GovernanceEvent> events;

    {
        EngineLock lock(*this);
        events.emplace_back(CastVoteLocked(voter, id, support));
        callback = eventCallback_;
    }

    Emit(callback, events);
}

Address GovernanceEngine::CastVoteBySig(ProposalId id, bool support,
                                        const std::vector<Byte>& signature) {
    EventCallback callback;
    std::vector<GovernanceEvent> events;
    Address voter;

    {
        EngineLock lock(*this);

        Hash256 digest = ComputeBallotDigest(domainSeparator_, id, support);
        auto signer = verifier_->Recover(digest, signature);
        if (!signer || signer->IsNull()) {
            Reject(GovernanceErrorCode::InvalidSignature,
                   "ballot signature for proposal " + std::to_string(id) + " does not recover");
        }

        voter = *signer;
        events.emplace_back(CastVoteLocked(voter, id, support));
        callback = eventCallback_;
    }

    Emit(callback, events);
    return voter;
}

// === Queries ===

ProposalState GovernanceEngine::GetState(ProposalId id) const {
    EngineLock lock(*this);
    return GetStateLocked(GetProposalLocked(id));
}

ProposalActions GovernanceEngine::GetActions(ProposalId id) const {
    EngineLock lock(*this);
    return GetProposalLocked(id).GetActions();
}

Receipt GovernanceEngine::GetReceipt(ProposalId id, const Address& voter) const {
    EngineLock lock(*this);
    return GetProposalLocked(id).GetReceipt(voter);
}

Proposal GovernanceEngine::GetProposal(ProposalId id) const {
    EngineLock lock(*this);
    return GetProposalLocked(id);
}

uint64_t GovernanceEngine::GetProposalCount() const {
    EngineLock lock(*this);
    return proposals_.size();
}

ProposalId GovernanceEngine::GetLatestProposalId(const Address& proposer) const {
    EngineLock lock(*this);
    auto it = latestProposalIds_.find(proposer);
    return it == latestProposalIds_.end() ? 0 : it->second;
}

// === Lifecycle ===

void GovernanceEngine::ProcessBlock(Checkpoint height) {
    EngineLock lock(*this);

    if (height < currentHeight_) {
        Reject(GovernanceErrorCode::InvalidState,
               "height " + std::to_string(height) + " is below current height " +
               std::to_string(currentHeight_));
    }

    currentHeight_ = height;
    LOG_TRACE(LogCategory::GOVERNANCE) << "Height " << height;
}

Checkpoint GovernanceEngine::GetCurrentHeight() const {
    EngineLock lock(*this);
    return currentHeight_;
}

void GovernanceEngine::SetEventCallback(EventCallback callback) {
    EngineLock lock(*this);
    eventCallback_ = std::move(callback);
}

} // namespace governance
} // namespace quorum
