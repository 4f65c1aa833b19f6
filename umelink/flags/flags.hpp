#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <type_traits>

namespace umelink
{

/**
 * Enum-indexed bit flags.
 *
 * Not synchronised: the owning object guards its flags with its own mutex, the same one that
 * serialises its completion handlers.
 */
template <typename FlagType>
class Flags
{
    static_assert(std::is_enum<FlagType>::value, "FlagType must be an enum");

public:
    Flags() = default;

    /**
     * Set a specific flag bit
     * @param flag The flag to set (enum value will be converted to bit position)
     */
    void set_flag(FlagType flag) { _flags |= bit(flag); }

    /**
     * Clear a specific flag bit
     * @param flag The flag to clear (enum value will be converted to bit position)
     */
    void clear_flag(FlagType flag) { _flags &= ~bit(flag); }

    /**
     * Get the state of a specific flag bit
     * @param flag The flag to check (enum value will be converted to bit position)
     * @return true if the flag bit is set, false otherwise
     */
    bool get_flag(FlagType flag) const { return (_flags & bit(flag)) != 0; }

    /// True when at least one of the given flags is set.
    bool any_of(std::initializer_list<FlagType> flags) const
    {
        for (FlagType flag : flags)
        {
            if (get_flag(flag))
            {
                return true;
            }
        }
        return false;
    }

    void clear_all() { _flags = 0; }

    std::uint32_t get_raw() const { return _flags; }

private:
    static std::uint32_t bit(FlagType flag) { return 1U << static_cast<std::uint32_t>(flag); }

    std::uint32_t _flags = 0;
};

/**
 * Render the set flags as "[a, b]". Relies on a to_string(FlagType) overload next to the enum.
 */
template <typename FlagType>
std::string describe(const Flags<FlagType>& flags, std::initializer_list<FlagType> known)
{
    std::string result = "[";
    bool first         = true;
    for (FlagType flag : known)
    {
        if (flags.get_flag(flag))
        {
            if (!first)
            {
                result += ", ";
            }
            result += to_string(flag);
            first = false;
        }
    }
    result += "]";
    return result;
}

} // namespace umelink
