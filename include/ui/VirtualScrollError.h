#pragma once

#include <stdexcept>
#include <string>

namespace VirtualScroll {

/**
 * @brief Raised when a list configuration cannot be honoured (negative counts, missing getters, bad JSON)
 */
class ConfigurationError : public std::invalid_argument {
  public:
    explicit ConfigurationError(const std::string &what) : std::invalid_argument(what) {}
};

/**
 * @brief Raised when an index outside [0, itemCount) is looked up
 */
class IndexOutOfRange : public std::out_of_range {
  public:
    IndexOutOfRange(int index, int itemCount)
        : std::out_of_range("Index " + std::to_string(index) + " is outside [0, " + std::to_string(itemCount) + ")"),
          m_index(index), m_itemCount(itemCount) {}

    int index() const { return m_index; }
    int itemCount() const { return m_itemCount; }

  private:
    int m_index;
    int m_itemCount;
};

} // namespace VirtualScroll
