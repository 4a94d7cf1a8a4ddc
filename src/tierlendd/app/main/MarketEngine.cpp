#include <tierlendd/app/main/MarketEngine.h>

namespace tierlend {

MarketEngine::MarketEngine(
    ProviderSet providers,
    ripple::Logs& logs,
    Timestamp closeTime)
    : j_(logs.journal("Market"))
    , applyJournal_(logs.journal("Apply"))
    , providers_(providers)
    , ledger_(closeTime)
{
}

ApplyResult
MarketEngine::initialize(
    AccountID const& authority,
    MarketParameters const& parameters)
{
    Transaction tx;
    tx.type = ttMARKET_SET;
    tx.account = authority;
    tx.marketParameters = parameters;

    auto const result = submit(tx);
    if (result.applied)
    {
        JLOG(j_.info()) << "Market initialized, authority " << authority;
    }
    else
    {
        JLOG(j_.error()) << "Market initialization failed: "
                         << transHuman(result.ter);
    }
    return result;
}

bool
MarketEngine::applying() const
{
    return applyingThread_.load() == std::this_thread::get_id();
}

std::unique_lock<std::mutex>
MarketEngine::lockUnlessApplying() const
{
    // The applying thread owns the lock already and sees a consistent ledger.
    if (applying())
        return {};
    return std::unique_lock(mutex_);
}

ApplyResult
MarketEngine::applyLocked(Transaction const& tx, ApplyFlags flags)
{
    if (applying())
    {
        JLOG(j_.warn()) << "Refusing " << to_string(tx.type)
                        << " submitted while applying a transaction.";
        return {tefREENTRANT_SUBMIT, false, std::nullopt};
    }

    std::lock_guard lock(mutex_);

    struct Applying
    {
        std::atomic<std::thread::id>& thread;

        explicit Applying(std::atomic<std::thread::id>& t) : thread(t)
        {
            thread = std::this_thread::get_id();
        }

        ~Applying()
        {
            thread = std::thread::id{};
        }
    } const guard{applyingThread_};

    return apply(ledger_, tx, providers_, flags, applyJournal_);
}

ApplyResult
MarketEngine::submit(Transaction const& tx)
{
    return applyLocked(tx, tapNONE);
}

ApplyResult
MarketEngine::simulate(Transaction const& tx)
{
    return applyLocked(tx, tapDRY_RUN);
}

Timestamp
MarketEngine::closeTime() const
{
    auto const lock = lockUnlessApplying();
    return ledger_.closeTime();
}

bool
MarketEngine::setCloseTime(Timestamp closeTime)
{
    if (applying())
    {
        JLOG(j_.warn()) << "Refusing to move the clock while applying a "
                           "transaction.";
        return false;
    }

    std::lock_guard lock(mutex_);
    if (closeTime < ledger_.closeTime())
    {
        JLOG(j_.warn()) << "Refusing to move the clock back from "
                        << ledger_.closeTime() << " to " << closeTime;
        return false;
    }
    ledger_.setCloseTime(closeTime);
    return true;
}

std::optional<MarketParameters>
MarketEngine::parameters() const
{
    auto const lock = lockUnlessApplying();
    if (auto const market = ledger_.market())
        return market->parameters;
    return std::nullopt;
}

Json::Value
MarketEngine::getJson() const
{
    auto const lock = lockUnlessApplying();
    return ledger_.getJson();
}

}  // namespace tierlend
