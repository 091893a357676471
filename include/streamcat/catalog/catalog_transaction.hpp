#pragma once

#include <cstdint>
#include <functional>
#include <system_error>
#include <vector>

namespace streamcat::catalog {

// Groups the staged effects of one DDL request. Commit hooks run in
// registration order; the first failure aborts the transaction and runs the
// abort hooks in reverse order. Abort hooks must not throw.
class CatalogTransaction final {
public:
    using CommitHook = std::function<std::error_code()>;
    using AbortHook = std::function<void()>;

    explicit CatalogTransaction(std::uint64_t transaction_id);

    CatalogTransaction(const CatalogTransaction&) = delete;
    CatalogTransaction& operator=(const CatalogTransaction&) = delete;
    CatalogTransaction(CatalogTransaction&&) = delete;
    CatalogTransaction& operator=(CatalogTransaction&&) = delete;

    [[nodiscard]] std::uint64_t transaction_id() const noexcept;
    [[nodiscard]] bool is_active() const noexcept;
    [[nodiscard]] bool is_committed() const noexcept;
    [[nodiscard]] bool is_aborted() const noexcept;

    void register_commit_hook(CommitHook hook);
    void register_abort_hook(AbortHook hook);
    std::error_code commit();
    std::error_code abort();

private:
    enum class State {
        Active,
        Committed,
        Aborted
    };

    void run_abort_hooks() noexcept;
    [[nodiscard]] bool can_register_hook() const noexcept;

    std::uint64_t transaction_id_ = 0U;
    std::vector<CommitHook> commit_hooks_{};
    std::vector<AbortHook> abort_hooks_{};
    State state_ = State::Active;
};

}  // namespace streamcat::catalog
