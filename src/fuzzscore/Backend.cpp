#include "Backend.hpp"
#include "RapidfuzzBackend.hpp"
#include "ReferenceBackend.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <mutex>
#include <string>

#include <plog/Log.h>

namespace fuzzscore::backend
{

namespace
{

std::once_flag s_bind_flag;
std::unique_ptr<IScoringBackend> s_backend;
std::atomic<bool> s_bound{false};

void bind(Kind kind, AlignerOptions options)
{
    s_backend = Create(kind, options);
    s_bound.store(true, std::memory_order_release);
    PLOG_INFO << "Scoring backend bound: " << s_backend->name()
              << (kind == Kind::Reference ? (options.autojunk ? " (autojunk on)" : " (autojunk off)") : "");
    if (kind == Kind::Rapidfuzz)
    {
        PLOG_WARNING << "rapidfuzz scores by Indel similarity; results differ from the reference backend on some inputs";
    }
}

} // namespace

const char* ToString(Kind kind)
{
    switch (kind)
    {
    case Kind::Reference:
        return "reference";
    case Kind::Rapidfuzz:
        return "rapidfuzz";
    default:
        return "unknown";
    }
}

std::optional<Kind> ParseKind(std::string_view name)
{
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "reference")
        return Kind::Reference;
    if (lowered == "rapidfuzz")
        return Kind::Rapidfuzz;
    return std::nullopt;
}

std::unique_ptr<IScoringBackend> Create(Kind kind, AlignerOptions options)
{
    switch (kind)
    {
    case Kind::Rapidfuzz:
        return std::make_unique<RapidfuzzBackend>();
    case Kind::Reference:
    default:
        return std::make_unique<ReferenceBackend>(options);
    }
}

bool Initialize(Kind kind, AlignerOptions options)
{
    bool bound_now = false;
    std::call_once(s_bind_flag, [&] {
        bind(kind, options);
        bound_now = true;
    });

    if (!bound_now)
    {
        PLOG_WARNING << "Scoring backend already bound to " << s_backend->name() << ", ignoring request for "
                     << ToString(kind);
    }
    return bound_now;
}

const IScoringBackend& Active()
{
    std::call_once(s_bind_flag, [] { bind(Kind::Reference, AlignerOptions{}); });
    return *s_backend;
}

bool IsBound()
{
    return s_bound.load(std::memory_order_acquire);
}

} // namespace fuzzscore::backend
