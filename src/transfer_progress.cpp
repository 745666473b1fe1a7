#include "podshuttle/transfer_progress.hpp"

namespace podshuttle {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

// Pending = 0, InProgress = 1, anything terminal = 2.
int stage(const TransferStatus& status) {
    if (std::holds_alternative<status::Pending>(status)) {
        return 0;
    }
    if (std::holds_alternative<status::InProgress>(status)) {
        return 1;
    }
    return 2;
}

} // namespace

bool isTerminal(const TransferStatus& status) {
    return stage(status) == 2;
}

std::string statusName(const TransferStatus& status) {
    return std::visit(Overloaded{
                          [](const status::Pending&) { return std::string{"Pending"}; },
                          [](const status::InProgress&) { return std::string{"InProgress"}; },
                          [](const status::Completed&) { return std::string{"Completed"}; },
                          [](const status::Failed&) { return std::string{"Failed"}; },
                          [](const status::Cancelled&) { return std::string{"Cancelled"}; },
                      },
                      status);
}

std::string failureReason(const TransferStatus& status) {
    if (const auto* failed = std::get_if<status::Failed>(&status)) {
        return failed->reason;
    }
    return {};
}

bool canTransition(const TransferStatus& from, const TransferStatus& to) {
    const int from_stage = stage(from);
    const int to_stage = stage(to);
    if (from_stage == 2) {
        return false;
    }
    if (from_stage == 1 && to_stage == 1) {
        return true;
    }
    return to_stage > from_stage;
}

} // namespace podshuttle
