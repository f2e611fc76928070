#ifndef INCTRIE_ART_HPP
#define INCTRIE_ART_HPP

#include <inctrie/errors.hpp>
#include <inctrie/name.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <utility>

namespace inctrie {

/**
 * Articulation: a shared handle to a value that is either already computed
 * (put, named cells) or computed on first force (lazy).
 *
 * The cell is reference counted and shared by every copy of the handle, by
 * every trie that embeds it and by the engine table that created it. Once
 * forced, the value never changes.
 *
 * Thread safety: none. Forcing mutates the cell the first time.
 */
template<typename T>
class Art {
public:
    // Eager, anonymous
    static Art put(T value) {
        auto cell = std::make_shared<Cell>();
        cell->value.emplace(std::move(value));
        return Art(std::move(cell));
    }

    // Eager, carrying the name it was registered under
    static Art named(Name name, T value) {
        auto cell = std::make_shared<Cell>();
        cell->name.emplace(std::move(name));
        cell->value.emplace(std::move(value));
        return Art(std::move(cell));
    }

    // Deferred: fn runs on the first force, at most once
    static Art lazy(std::function<T()> fn) {
        auto cell = std::make_shared<Cell>();
        cell->thunk = std::move(fn);
        return Art(std::move(cell));
    }

    /**
     * Resolve to the value, running the deferred computation if needed.
     * @throws EngineError if the computation forces its own articulation
     */
    const T& force() const {
        Cell& cell = *cell_;
        if (cell.value) {
            return *cell.value;
        }
        if (cell.forcing) {
            throw EngineError("articulation forced while its own computation is running");
        }

        cell.forcing = true;
        struct ForcingGuard {
            Cell& c;
            ~ForcingGuard() { c.forcing = false; }
        } guard{cell};

        cell.value.emplace(cell.thunk());
        cell.thunk = nullptr;
        return *cell.value;
    }

    bool is_forced() const { return cell_->value.has_value(); }

    const std::optional<Name>& name() const { return cell_->name; }

    // Handle identity: both refer to the same cell
    bool same(const Art& other) const { return cell_ == other.cell_; }

    long use_count() const { return cell_.use_count(); }

private:
    struct Cell {
        std::optional<Name> name;
        std::optional<T> value;
        std::function<T()> thunk;
        bool forcing = false;
    };

    explicit Art(std::shared_ptr<Cell> cell) : cell_(std::move(cell)) {}

    std::shared_ptr<Cell> cell_;
};

} // namespace inctrie

#endif // INCTRIE_ART_HPP
