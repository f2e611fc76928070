#include <inctrie/name.hpp>
#include <inctrie/types.hpp>

namespace inctrie {

struct Name::Rep {
    Kind kind;
    std::string text;
    std::size_t number;
    std::shared_ptr<const Rep> left;   // PAIR first, FORK_* parent
    std::shared_ptr<const Rep> right;  // PAIR second
    uint64_t hash;
};

namespace {

uint64_t hash_string(const std::string& s) {
    uint64_t h = FNV_OFFSET;
    for (unsigned char c : s) {
        h = fnv_hash(h, c);
    }
    return h;
}

std::shared_ptr<const Name::Rep> unit_rep() {
    static const std::shared_ptr<const Name::Rep> rep = [] {
        auto r = std::make_shared<Name::Rep>();
        r->kind = Name::Kind::UNIT;
        r->number = 0;
        r->hash = fnv_hash(FNV_OFFSET, static_cast<uint64_t>(Name::Kind::UNIT));
        return std::shared_ptr<const Name::Rep>(std::move(r));
    }();
    return rep;
}

bool rep_equal(const Name::Rep* a, const Name::Rep* b) {
    if (a == b) return true;
    if (!a || !b) return false;
    if (a->hash != b->hash || a->kind != b->kind) return false;

    switch (a->kind) {
        case Name::Kind::UNIT:
            return true;
        case Name::Kind::STRING:
            return a->text == b->text;
        case Name::Kind::NUMBER:
            return a->number == b->number;
        case Name::Kind::PAIR:
            return rep_equal(a->left.get(), b->left.get()) &&
                   rep_equal(a->right.get(), b->right.get());
        case Name::Kind::FORK_LEFT:
        case Name::Kind::FORK_RIGHT:
            return rep_equal(a->left.get(), b->left.get());
    }
    return false;
}

void rep_to_string(const Name::Rep* rep, std::string& out) {
    switch (rep->kind) {
        case Name::Kind::UNIT:
            out += "()";
            break;
        case Name::Kind::STRING:
            out += '"';
            out += rep->text;
            out += '"';
            break;
        case Name::Kind::NUMBER:
            out += std::to_string(rep->number);
            break;
        case Name::Kind::PAIR:
            out += '(';
            rep_to_string(rep->left.get(), out);
            out += ", ";
            rep_to_string(rep->right.get(), out);
            out += ')';
            break;
        case Name::Kind::FORK_LEFT:
            rep_to_string(rep->left.get(), out);
            out += ".0";
            break;
        case Name::Kind::FORK_RIGHT:
            rep_to_string(rep->left.get(), out);
            out += ".1";
            break;
    }
}

} // namespace

Name::Name() : rep_(unit_rep()) {}

Name::Name(std::shared_ptr<const Rep> rep) : rep_(std::move(rep)) {}

Name Name::unit() {
    return Name(unit_rep());
}

Name Name::of_str(const std::string& s) {
    auto rep = std::make_shared<Rep>();
    rep->kind = Kind::STRING;
    rep->text = s;
    rep->number = 0;
    rep->hash = fnv_hash(hash_string(s), static_cast<uint64_t>(Kind::STRING));
    return Name(std::move(rep));
}

Name Name::of_usize(std::size_t n) {
    auto rep = std::make_shared<Rep>();
    rep->kind = Kind::NUMBER;
    rep->number = n;
    rep->hash = fnv_mix(static_cast<uint64_t>(n), fnv_hash(FNV_OFFSET, static_cast<uint64_t>(Kind::NUMBER)));
    return Name(std::move(rep));
}

Name Name::pair(const Name& a, const Name& b) {
    auto rep = std::make_shared<Rep>();
    rep->kind = Kind::PAIR;
    rep->number = 0;
    rep->left = a.rep_;
    rep->right = b.rep_;
    uint64_t h = fnv_hash(FNV_OFFSET, static_cast<uint64_t>(Kind::PAIR));
    h = fnv_hash(h, a.rep_->hash);
    h = fnv_hash(h, b.rep_->hash);
    rep->hash = h;
    return Name(std::move(rep));
}

std::pair<Name, Name> Name::fork() const {
    auto make_child = [this](Kind side) {
        auto rep = std::make_shared<Rep>();
        rep->kind = side;
        rep->number = 0;
        rep->left = rep_;
        rep->hash = fnv_hash(fnv_hash(rep_->hash, static_cast<uint64_t>(side)), FNV_PRIME);
        return Name(std::shared_ptr<const Rep>(std::move(rep)));
    };
    return {make_child(Kind::FORK_LEFT), make_child(Kind::FORK_RIGHT)};
}

Name::Kind Name::kind() const {
    return rep_->kind;
}

uint64_t Name::hash() const {
    return rep_->hash;
}

std::string Name::to_string() const {
    std::string out;
    rep_to_string(rep_.get(), out);
    return out;
}

bool Name::operator==(const Name& other) const {
    return rep_equal(rep_.get(), other.rep_.get());
}

} // namespace inctrie
