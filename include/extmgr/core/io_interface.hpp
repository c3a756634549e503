#ifndef EXTMGR_CORE_IO_INTERFACE_HPP
#define EXTMGR_CORE_IO_INTERFACE_HPP

#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "extmgr/core/message_catalog.hpp"

namespace extmgr {
namespace core {

/**
 * @brief Output verbosity. A message is written when its level is not above
 * the sink's threshold.
 */
enum class Verbosity : int {
    Quiet = 1,
    Normal = 2,
    Verbose = 4,
    VeryVerbose = 8,
    Debug = 16
};

/**
 * @brief A translatable message key with its parameters.
 */
struct Message {
    std::string key;
    std::vector<std::string> parameters;

    Message(const char* k) : key(k) {}
    Message(std::string k) : key(std::move(k)) {}
    Message(std::string k, std::vector<std::string> params)
        : key(std::move(k)), parameters(std::move(params)) {}
};

/**
 * @brief Sink for progress notices and non-fatal errors. Never used for
 * control flow.
 */
class IOInterface {
public:
    virtual ~IOInterface() = default;

    virtual void write_error(const Message& message,
                             bool newline = true,
                             Verbosity verbosity = Verbosity::Normal) = 0;

    virtual Verbosity verbosity() const = 0;

    bool is_verbose() const { return verbosity() >= Verbosity::Verbose; }
};

/**
 * @brief Discards everything.
 */
class NullIO : public IOInterface {
public:
    void write_error(const Message&, bool, Verbosity) override {}
    Verbosity verbosity() const override { return Verbosity::Quiet; }
};

/**
 * @brief Translates messages and keeps them in memory until a front end
 * collects them.
 */
class BufferedIO : public IOInterface {
public:
    explicit BufferedIO(MessageCatalog catalog = MessageCatalog::defaults(),
                        Verbosity verbosity = Verbosity::Normal);

    void write_error(const Message& message,
                     bool newline = true,
                     Verbosity verbosity = Verbosity::Normal) override;

    Verbosity verbosity() const override { return verbosity_; }
    void set_verbosity(Verbosity verbosity) { verbosity_ = verbosity; }

    /**
     * @brief Completed lines, the pending partial line excluded.
     */
    const std::vector<std::string>& lines() const { return lines_; }

    /**
     * @brief All output joined with newlines, including a pending partial line.
     */
    std::string output() const;

    void clear();

private:
    MessageCatalog catalog_;
    Verbosity verbosity_;
    std::vector<std::string> lines_;
    std::string pending_;
};

/**
 * @brief Translates messages and forwards them to the library logger.
 * Quiet and Normal messages are logged at info level, the rest at debug.
 */
class LoggingIO : public IOInterface {
public:
    explicit LoggingIO(MessageCatalog catalog = MessageCatalog::defaults(),
                       Verbosity verbosity = Verbosity::Normal);

    void write_error(const Message& message,
                     bool newline = true,
                     Verbosity verbosity = Verbosity::Normal) override;

    Verbosity verbosity() const override { return verbosity_; }

private:
    MessageCatalog catalog_;
    Verbosity verbosity_;
    std::string pending_;
};

} // namespace core
} // namespace extmgr

#endif // EXTMGR_CORE_IO_INTERFACE_HPP
