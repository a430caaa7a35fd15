#pragma once

#include <functional>
#include <nlohmann/json.hpp>
#include <ostream>
#include <spdlog/fmt/fmt.h>

namespace Biomorph {

// Integer identifier with a distinct type per tag, so creature ids, body ids
// and constraint ids cannot be mixed up.
//
//   using CreatureId = StrongType<struct CreatureIdTag>;
//   CreatureId id{ 7 };
//   int raw = id.get();
template <typename Tag>
class StrongType {
public:
    constexpr StrongType() : value_{ -1 } {}
    constexpr explicit StrongType(int value) : value_{ value } {}

    [[nodiscard]] constexpr int get() const { return value_; }
    [[nodiscard]] constexpr bool isValid() const { return value_ >= 0; }

    constexpr bool operator==(const StrongType& other) const { return value_ == other.value_; }
    constexpr bool operator!=(const StrongType& other) const { return value_ != other.value_; }
    constexpr bool operator<(const StrongType& other) const { return value_ < other.value_; }
    constexpr bool operator>(const StrongType& other) const { return value_ > other.value_; }

    StrongType& operator++()
    {
        ++value_;
        return *this;
    }
    StrongType operator++(int)
    {
        StrongType temp = *this;
        ++value_;
        return temp;
    }

private:
    int value_;
};

template <typename Tag>
void to_json(nlohmann::json& j, const StrongType<Tag>& st)
{
    j = st.get();
}

template <typename Tag>
void from_json(const nlohmann::json& j, StrongType<Tag>& st)
{
    st = StrongType<Tag>{ j.get<int>() };
}

template <typename Tag>
std::ostream& operator<<(std::ostream& os, const StrongType<Tag>& st)
{
    return os << st.get();
}

} // namespace Biomorph

template <typename Tag>
struct std::hash<Biomorph::StrongType<Tag>> {
    std::size_t operator()(const Biomorph::StrongType<Tag>& st) const noexcept
    {
        return std::hash<int>{}(st.get());
    }
};

template <typename Tag>
struct fmt::formatter<Biomorph::StrongType<Tag>> : fmt::formatter<int> {
    auto format(const Biomorph::StrongType<Tag>& st, fmt::format_context& ctx) const
    {
        return fmt::formatter<int>::format(st.get(), ctx);
    }
};
