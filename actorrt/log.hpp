#pragma once

#include <functional>
#include <sstream>
#include <string_view>

namespace NActorRt {

enum class ELogLevel {
    Debug,
    Info,
    Warning,
    Error,
    None
};

std::string_view ToString(ELogLevel level);

/**
 * @class TLogger
 * @brief Leveled line logger, writes to std::cerr unless another sink is set.
 *
 * @code{.cpp}
 * logger.Warning() << "mailbox of " << address << " is full";
 * @endcode
 * A line is emitted when the temporary returned by Debug()/Info()/... is
 * destroyed. Disabled levels format nothing.
 */
class TLogger {
public:
    using TSink = std::function<void(ELogLevel, std::string_view)>;

    class TLine {
    public:
        TLine(const TLogger* logger, ELogLevel level)
            : Logger_(logger)
            , Level_(level)
        { }

        TLine(TLine&& other)
            : Logger_(other.Logger_)
            , Level_(other.Level_)
            , Stream_(std::move(other.Stream_))
        {
            other.Logger_ = nullptr;
        }

        TLine(const TLine&) = delete;
        TLine& operator=(const TLine&) = delete;

        ~TLine() {
            if (Logger_) {
                Logger_->Write(Level_, Stream_.view());
            }
        }

        template<typename T>
        TLine& operator<<(const T& value) {
            if (Logger_) {
                Stream_ << value;
            }
            return *this;
        }

    private:
        const TLogger* Logger_;
        ELogLevel Level_;
        std::ostringstream Stream_;
    };

    explicit TLogger(ELogLevel level = ELogLevel::Info, TSink sink = {});

    bool Enabled(ELogLevel level) const {
        return level >= Level_ && level != ELogLevel::None;
    }

    void SetLevel(ELogLevel level) {
        Level_ = level;
    }

    ELogLevel Level() const {
        return Level_;
    }

    void Write(ELogLevel level, std::string_view line) const;

    TLine At(ELogLevel level) const {
        return TLine(Enabled(level) ? this : nullptr, level);
    }

    TLine Debug() const { return At(ELogLevel::Debug); }
    TLine Info() const { return At(ELogLevel::Info); }
    TLine Warning() const { return At(ELogLevel::Warning); }
    TLine Error() const { return At(ELogLevel::Error); }

private:
    ELogLevel Level_;
    TSink Sink_;
};

} // namespace NActorRt
