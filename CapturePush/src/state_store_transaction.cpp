#include "capturepush/state_store_transaction.hpp"

StateStoreTransaction::StateStoreTransaction(SnapshotDatabase * database, std::shared_ptr<spdlog::logger> logger, std::string nameHint) :
    mDatabase(database), mLogger(logger), mCommited(false), mStart(std::chrono::system_clock::now()), mNameHint(nameHint)
{
    mDatabase->beginTransaction();
}

StateStoreTransaction::~StateStoreTransaction() noexcept // nothrow
{
    if (false == mCommited) {
        try {
            mDatabase->rollbackTransaction();
        } catch (SQLite::Exception&) {
            // Never throw an exception in a destructor: error if
            // already rollbacked, but no harm is caused by this.
        }
    }
}

void StateStoreTransaction::commit()
{
    if (false == mCommited) {
        mDatabase->commitTransaction();
        mCommited = true;

        auto elapsed = std::chrono::system_clock::now() - mStart;
        long long milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
        if (milliseconds > 80 && mLogger) {
            mLogger->warn("[SLOW] Transaction={} > 80ms ({}ms)", mNameHint, milliseconds);
        }
    } else {
        throw SQLite::Exception("Transaction already commited.");
    }
}
