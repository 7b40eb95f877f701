#include "stumper/core/facade.hpp"

#include "stumper/core/error.hpp"
#include "stumper/core/log.hpp"
#include "stumper/utils/utf8.hpp"

#include <spdlog/spdlog.h>

#include <utility>
#include <vector>

namespace stumper::core {

std::error_code Facade::create(FacadeConfig config, std::unique_ptr<Facade> &out) {
    std::vector<std::string_view> parts;
    const auto ec = stumper::utils::split_characters(config.brackets, parts);
    if (ec || parts.size() != 2) {
        spdlog::error("stumper: brackets must be exactly 2 characters, got \"{}\"",
                      config.brackets);
        return make_error_code(errc::invalid_brackets);
    }

    // parts 指向 config.brackets，移动 config 前先拷出。
    const std::string open{parts[0]};
    const std::string close{parts[1]};
    out.reset(new Facade(std::move(config), open, close));
    return {};
}

Facade::Facade(FacadeConfig config, std::string_view open, std::string_view close)
    : config_(std::move(config)), open_(open), close_(close) {}

void Facade::log(std::string_view message, Severity level, const CallOptions &options) const {
    switch (level) {
    case Severity::trace:
        trace(message, options);
        break;
    case Severity::debug:
        debug(message, options);
        break;
    case Severity::info:
        info(message, options);
        break;
    case Severity::notice:
        notice(message, options);
        break;
    case Severity::warning:
        warning(message, options);
        break;
    case Severity::error:
        error(message, options);
        break;
    case Severity::fault:
        fault(message, options);
        break;
    }
}

void Facade::trace(std::string_view message, const CallOptions &options) const {
    emit_(Severity::trace, message, options);
}

void Facade::debug(std::string_view message, const CallOptions &options) const {
    emit_(Severity::debug, message, options);
}

void Facade::info(std::string_view message, const CallOptions &options) const {
    emit_(Severity::info, message, options);
}

void Facade::notice(std::string_view message, const CallOptions &options) const {
    emit_(Severity::notice, message, options);
}

void Facade::warning(std::string_view message, const CallOptions &options) const {
    emit_(Severity::warning, message, options);
}

void Facade::error(std::string_view message, const CallOptions &options) const {
    emit_(Severity::error, message, options);
}

void Facade::fault(std::string_view message, const CallOptions &options) const {
    emit_(Severity::fault, message, options);
}

std::string Facade::format(Severity level,
                           std::string_view message,
                           std::string_view prefix,
                           std::string_view separator) const {
    const std::string_view effective_prefix = prefix.empty() ? config_.prefix : prefix;
    const std::string_view effective_separator =
        separator.empty() ? config_.separator : separator;

    std::string line;
    if (config_.show_level) {
        line += level_slug_(level);
    }
    line.append(effective_prefix);
    line.append(effective_separator);
    line += ' ';
    line.append(message);
    return line;
}

void Facade::emit_(Severity level,
                   std::string_view message,
                   const CallOptions &options) const {
    if (!should_log(level, config_.minimum_severity)) {
        return;
    }

    const auto line = format(level, message, options.prefix, options.separator);
    if (options.sink != nullptr) {
        options.sink->write(level, line);
        return;
    }
    default_sink()->write(level, line);
}

std::string Facade::level_slug_(Severity level) const {
    const std::string_view glyph =
        config_.use_icons ? severity_icon(level) : severity_initial(level);

    std::string slug;
    slug.reserve(open_.size() + glyph.size() + close_.size() + 1);
    slug += open_;
    slug.append(glyph);
    slug += close_;
    slug += ' ';
    return slug;
}

const Facade &default_facade() {
    static const Facade instance{FacadeConfig{}, "[", "]"};
    return instance;
}

} // namespace stumper::core
