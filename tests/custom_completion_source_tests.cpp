#include <cassert>
#include <string>
#include <vector>

#include "completion/custom_completion_source.hpp"
#include "in_memory_settings.hpp"

using urlbar::CompletionSourceError;
using urlbar::CustomCompletionSource;
using urlbar::Toggle;
using urlbar::sanitize_domain;
using urlbar::testing::InMemorySettings;

namespace {

using Domains = std::vector<std::string>;

void test_sanitize_domain_strips_only_leading_prefixes() {
    assert(sanitize_domain("example.com") == "example.com");
    assert(sanitize_domain("  \texample.com") == "example.com");
    assert(sanitize_domain("http://example.com") == "example.com");
    assert(sanitize_domain("HTTPS://WWW.Example.com/") == "Example.com");
    assert(sanitize_domain("www.example.com") == "example.com");
    assert(sanitize_domain("example.com/www.") == "example.com/www.");
    assert(sanitize_domain("ftp://example.com") == "ftp://example.com");
    assert(sanitize_domain("example.com//") == "example.com/");
    assert(sanitize_domain("   ").empty());
}

void test_enabled_follows_toggle() {
    InMemorySettings settings;
    CustomCompletionSource source(settings);

    assert(source.enabled());

    settings.set_toggle(Toggle::CustomDomainAutocomplete, false);
    assert(!source.enabled());

    settings.set_toggle(Toggle::DomainAutocomplete, true);
    assert(!source.enabled());
}

void test_add_stores_original_input_once() {
    InMemorySettings settings;
    CustomCompletionSource source(settings);

    assert(source.add("example.com").has_value());
    assert(source.suggestions() == Domains({"example.com"}));

    assert(source.add("https://www.mozilla.org/").has_value());
    assert(source.suggestions() == Domains({"example.com", "https://www.mozilla.org/"}));
    assert(settings.domain_writes == 2);
}

void test_add_rejects_invalid_urls() {
    InMemorySettings settings;
    settings.domains = {"example.com"};
    CustomCompletionSource source(settings);

    for (const auto *input : {"", "   ", "nötld", "http://", "https://www.", "/", "localhost/"}) {
        const auto result = source.add(input);
        assert(!result.has_value());
        assert(result.error() == CompletionSourceError::InvalidUrl);
    }

    assert(source.suggestions() == Domains({"example.com"}));
    assert(settings.domain_writes == 0);
}

void test_add_rejects_duplicates_regardless_of_case_or_prefix() {
    InMemorySettings settings;
    CustomCompletionSource source(settings);

    assert(source.add("example.com").has_value());

    for (const auto *input : {"example.com", "EXAMPLE.com", "http://example.com", "www.Example.com/", " example.com"}) {
        const auto result = source.add(input);
        assert(!result.has_value());
        assert(result.error() == CompletionSourceError::DuplicateDomain);
    }

    assert(source.suggestions() == Domains({"example.com"}));
    assert(settings.domain_writes == 1);
}

void test_add_detects_duplicates_of_prefixed_entries() {
    InMemorySettings settings;
    settings.domains = {"https://www.mozilla.org/"};
    CustomCompletionSource source(settings);

    const auto result = source.add("mozilla.org");
    assert(!result.has_value());
    assert(result.error() == CompletionSourceError::DuplicateDomain);

    const auto indexed = source.add("MOZILLA.ORG", 0);
    assert(!indexed.has_value());
    assert(indexed.error() == CompletionSourceError::DuplicateDomain);
}

void test_add_at_index_inserts_original_input() {
    InMemorySettings settings;
    settings.domains = {"a.com", "c.com"};
    CustomCompletionSource source(settings);

    assert(source.add("http://b.com", 1).has_value());
    assert(source.suggestions() == Domains({"a.com", "http://b.com", "c.com"}));

    assert(source.add("first.com", 0).has_value());
    assert(source.add("last.com", 4).has_value());
    assert(source.suggestions() == Domains({"first.com", "a.com", "http://b.com", "c.com", "last.com"}));
}

void test_add_at_index_validates() {
    InMemorySettings settings;
    settings.domains = {"a.com"};
    CustomCompletionSource source(settings);

    const auto out_of_range = source.add("b.com", 2);
    assert(!out_of_range.has_value());
    assert(out_of_range.error() == CompletionSourceError::IndexOutOfRange);

    const auto invalid = source.add("   ", 0);
    assert(!invalid.has_value());
    assert(invalid.error() == CompletionSourceError::InvalidUrl);

    const auto duplicate = source.add("A.com", 0);
    assert(!duplicate.has_value());
    assert(duplicate.error() == CompletionSourceError::DuplicateDomain);

    assert(source.suggestions() == Domains({"a.com"}));
    assert(settings.domain_writes == 0);
}

void test_add_rejects_control_characters() {
    InMemorySettings settings;
    settings.domains = {"a.com"};
    CustomCompletionSource source(settings);

    for (const char *input : {"b.com\ndomain evil.com\ntoggle enableDomainAutocomplete off", "b.com\r", "\nb.com",
                              "ex\tample.com", "b.c\x7fom"}) {
        const auto appended = source.add(input);
        assert(!appended.has_value());
        assert(appended.error() == CompletionSourceError::InvalidUrl);

        const auto inserted = source.add(input, 0);
        assert(!inserted.has_value());
        assert(inserted.error() == CompletionSourceError::InvalidUrl);
    }

    assert(source.suggestions() == Domains({"a.com"}));
    assert(settings.domain_writes == 0);
}

void test_remove() {
    InMemorySettings settings;
    settings.domains = {"a.com", "b.com", "c.com"};
    CustomCompletionSource source(settings);

    for (const std::size_t index : {std::size_t{3}, std::size_t{100}}) {
        const auto result = source.remove(index);
        assert(!result.has_value());
        assert(result.error() == CompletionSourceError::IndexOutOfRange);
    }
    assert(source.suggestions() == Domains({"a.com", "b.com", "c.com"}));

    assert(source.remove(1).has_value());
    assert(source.suggestions() == Domains({"a.com", "c.com"}));

    assert(source.remove(0).has_value());
    assert(source.remove(0).has_value());
    assert(source.suggestions().empty());

    const auto empty = source.remove(0);
    assert(!empty.has_value());
    assert(empty.error() == CompletionSourceError::IndexOutOfRange);
}

void test_move_reorders_entries() {
    InMemorySettings settings;
    settings.domains = {"a.com", "b.com", "c.com", "d.com"};
    CustomCompletionSource source(settings);

    assert(source.move(0, 2).has_value());
    assert(source.suggestions() == Domains({"b.com", "c.com", "a.com", "d.com"}));

    assert(source.move(3, 0).has_value());
    assert(source.suggestions() == Domains({"d.com", "b.com", "c.com", "a.com"}));

    assert(source.move(1, 1).has_value());
    assert(source.suggestions() == Domains({"d.com", "b.com", "c.com", "a.com"}));

    const auto result = source.move(0, 4);
    assert(!result.has_value());
    assert(result.error() == CompletionSourceError::IndexOutOfRange);
    assert(settings.domain_writes == 3);
}

void test_every_call_reads_through_settings() {
    InMemorySettings settings;
    CustomCompletionSource source(settings);

    assert(source.add("a.com").has_value());
    settings.domains.push_back("external.com");

    assert(source.suggestions() == Domains({"a.com", "external.com"}));
    assert(source.add("b.com").has_value());
    assert(settings.domains == Domains({"a.com", "external.com", "b.com"}));
}

void test_error_messages() {
    assert(!urlbar::error_message(CompletionSourceError::InvalidUrl).empty());
    assert(urlbar::error_message(CompletionSourceError::DuplicateDomain).empty());
    assert(urlbar::error_message(CompletionSourceError::IndexOutOfRange).empty());
}

} // namespace

int main() {
    test_sanitize_domain_strips_only_leading_prefixes();
    test_enabled_follows_toggle();
    test_add_stores_original_input_once();
    test_add_rejects_invalid_urls();
    test_add_rejects_duplicates_regardless_of_case_or_prefix();
    test_add_detects_duplicates_of_prefixed_entries();
    test_add_at_index_inserts_original_input();
    test_add_at_index_validates();
    test_add_rejects_control_characters();
    test_remove();
    test_move_reorders_entries();
    test_every_call_reads_through_settings();
    test_error_messages();

    return 0;
}
