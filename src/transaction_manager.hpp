#pragma once

#include <memory>

namespace querybus {

class transaction {
public:
    virtual ~transaction() = default;
    virtual void commit() = 0;
    virtual void rollback() = 0;
};

// Starts the transaction bound to one handler attempt.
class transaction_manager {
public:
    virtual ~transaction_manager() = default;
    virtual std::unique_ptr<transaction> start_transaction() = 0;
};

class no_transaction_manager final : public transaction_manager {
public:
    std::unique_ptr<transaction> start_transaction() override {
        return std::make_unique<no_op_transaction>();
    }

private:
    class no_op_transaction final : public transaction {
    public:
        void commit() override {}
        void rollback() override {}
    };
};

} // namespace querybus
