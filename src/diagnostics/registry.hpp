/*
 * synext - Syntax extension expansion core
 *
 * diagnostics/registry.hpp
 * - Error code registry (`__register_diagnostic!` and friends)
 *
 * One registry exists per session. All access is under a lock held for
 * a single lookup-or-insert.
 */
#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <rustic.hpp>
#include <span.hpp>

namespace Diagnostics {

/// Maximum width of a line in an error code description
static const unsigned int MAX_DESCRIPTION_WIDTH = 80;

struct ErrorInfo
{
    rust::option<::std::string> description;
    rust::option<Span>  use_site;
};

class ErrorRegistry
{
public:
    struct UseResult
    {
        enum class Kind {
            /// First use, location recorded
            First,
            /// Used again from the recorded location
            Repeat,
            /// Used again from a different location (`previous` holds the first)
            Reused,
            Unregistered,
        };
        Kind    kind;
        Span    previous;
    };

private:
    mutable ::std::mutex    m_lock;
    ::std::map<RcString, ErrorInfo> m_codes;

public:
    ErrorRegistry() {}
    ErrorRegistry(const ErrorRegistry&) = delete;
    ErrorRegistry& operator=(const ErrorRegistry&) = delete;

    /// Register a code, returns false (leaving the existing entry) if it is already registered
    bool register_code(const RcString& code, rust::option<::std::string> description);
    /// Record a use of the code
    UseResult mark_used(const RcString& code, const Span& sp);

    bool is_registered(const RcString& code) const;
    rust::option<ErrorInfo> get(const RcString& code) const;
    size_t size() const;

    /// `(code, description)` for every code with a description, in ascending code order
    ::std::vector< ::std::pair<RcString, ::std::string> > render() const;

    /// Problems with a description's formatting (empty if it is well-formed)
    static ::std::vector<::std::string> check_description(const RcString& code, const ::std::string& description);
    /// Matches a footnote-style link reference (`[name]: http...`)
    static bool is_url_footnote(const ::std::string& line);
};

}   // namespace Diagnostics
