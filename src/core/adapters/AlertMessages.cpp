#include "core/adapters/AlertMessages.h"

#include "common/TimeUtils.h"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace riskguard {
namespace core {

namespace {
const char* kRule = "─────────────────";

std::string titleCase(const std::string& phase) {
    std::string out;
    bool upper = true;
    for (char c : phase) {
        if (c == '_') {
            out.push_back(' ');
            upper = true;
            continue;
        }
        out.push_back(upper ? static_cast<char>(std::toupper(static_cast<unsigned char>(c)))
                            : static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        upper = false;
    }
    return out;
}
} // namespace

std::string AlertMessages::symbolSummary(const PanicExecutionReport& report) {
    if (report.symbols_touched.empty()) {
        return "None";
    }
    std::string joined;
    for (size_t i = 0; i < report.symbols_touched.size(); ++i) {
        if (i > 0) joined += ", ";
        joined += report.symbols_touched[i];
    }
    if (joined.size() > 50) {
        return std::to_string(report.symbols_touched.size()) + " symbols";
    }
    return joined;
}

std::string AlertMessages::phaseTimings(const PanicExecutionReport& report) {
    if (report.phase_timings.empty()) {
        return "No timing data";
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    for (size_t i = 0; i < report.phase_timings.size(); ++i) {
        const auto& t = report.phase_timings[i];
        const char* mark = !t.success ? "❌" : (t.duration_sec < 5.0 ? "✅" : "⚠️");
        if (i > 0) oss << "\n";
        oss << mark << " " << titleCase(t.phase) << ": " << t.duration_sec << "s";
    }
    return oss.str();
}

std::string AlertMessages::panicStarted(const std::string& bot_name, long long started_at_ms) {
    std::ostringstream oss;
    oss << "🚨 PANIC BUTTON ACTIVATED\n"
        << "Bot: " << bot_name << "\n"
        << "Time: " << common::toIso8601(started_at_ms) << "\n"
        << "Status: STARTING...\n"
        << kRule << "\n"
        << "⚠️ Trading: DISABLED\n"
        << "🔄 Executing emergency procedures...";
    return oss.str();
}

std::string AlertMessages::panicCompleted(const std::string& bot_name, const PanicExecutionReport& report) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    oss << "✅ PANIC BUTTON COMPLETED\n"
        << "Bot: " << bot_name << "\n"
        << "Time: " << common::toIso8601(report.ended_at_ms) << "\n"
        << kRule << "\n"
        << "✅ Trading: DISABLED\n"
        << "✅ Orders canceled: " << report.orders_canceled << "\n"
        << "✅ Positions closed: " << report.positions_closed << "\n"
        << "✅ Symbols: " << symbolSummary(report) << "\n"
        << "⏱️ Duration: " << report.total_duration_sec << "s\n"
        << "🔒 Status: LOCKED\n\n"
        << "Phase Timings:\n" << phaseTimings(report) << "\n\n"
        << "Use /panic/reset to unlock after verification.";
    return oss.str();
}

std::string AlertMessages::panicFailed(const std::string& bot_name, const PanicExecutionReport& report) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    oss << "❌ PANIC BUTTON FAILED\n"
        << "Bot: " << bot_name << "\n"
        << "Time: " << common::toIso8601(report.ended_at_ms) << "\n"
        << kRule << "\n"
        << "❌ Error: " << (report.error_message.empty() ? "incomplete" : report.error_message) << "\n"
        << "🔄 Orders canceled: " << report.orders_canceled << "\n"
        << "🔄 Positions closed: " << report.positions_closed << "\n"
        << "📊 Symbols touched: " << symbolSummary(report) << "\n"
        << "⏱️ Duration: " << report.total_duration_sec << "s\n";
    if (!report.remaining_positions.empty() || !report.remaining_orders.empty()) {
        oss << "📌 Remaining: " << report.remaining_positions.size() << " position(s), "
            << report.remaining_orders.size() << " order(s)\n";
    }
    if (!report.warnings.empty()) {
        oss << "⚠️ Warnings: " << report.warnings.size() << "\n";
    }
    oss << "🔒 Status: LOCKED (FAILED_PARTIAL)\n\n"
        << "🚨 MANUAL INTERVENTION REQUIRED\n"
        << "Check positions and orders manually!";
    return oss.str();
}

std::string AlertMessages::reset(const std::string& bot_name, bool success, const std::string& message, long long now_ms) {
    std::ostringstream oss;
    if (success) {
        oss << "🔓 PANIC RESET SUCCESSFUL\n"
            << "Bot: " << bot_name << "\n"
            << "Time: " << common::toIso8601(now_ms) << "\n"
            << kRule << "\n"
            << "✅ Lock removed\n"
            << "✅ Trading: ENABLED\n\n"
            << message;
    } else {
        oss << "❌ PANIC RESET FAILED\n"
            << "Bot: " << bot_name << "\n"
            << "Time: " << common::toIso8601(now_ms) << "\n"
            << kRule << "\n"
            << "❌ Error: " << message << "\n"
            << "🔒 Status: Still LOCKED\n\n"
            << "Manual intervention required.";
    }
    return oss.str();
}

} // namespace core
} // namespace riskguard
