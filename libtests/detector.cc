#include <pdfscrub/assert_test.h>

#include <pdfscrub/ScrubDetector.hh>
#include <pdfscrub/ScrubExc.hh>

#include <iostream>
#include <map>
#include <stdexcept>

static std::shared_ptr<ScrubDetector>
find_builtin(std::string const& id)
{
    for (auto const& d: ScrubDetector::builtinSignatures()) {
        if (d->getId() == id) {
            return d;
        }
    }
    for (auto const& d: ScrubDetector::builtinPatterns()) {
        if (d->getId() == id) {
            return d;
        }
    }
    throw std::logic_error("no built-in detector " + id);
}

// The text of the first match, or "" if none
static std::string
first_match(std::string const& id, std::string const& data)
{
    auto finding = find_builtin(id)->scan(data, 0);
    return finding ? data.substr(finding->start, finding->end - finding->start) : "";
}

static void
test_signature()
{
    ScrubSignatureDetector pdf("pdf", "%PDF-", scrub_sev_high, 0.9, "embedded PDF document");
    assert(pdf.getInput() == ScrubDetector::i_binary);
    assert(pdf.getKind() == scrub_pt_binary);
    std::string data = "xx%PDF-1.4 junk %PDF-1.7";
    auto f = pdf.scan(data, 0);
    assert(f);
    assert(f->start == 2);
    assert(f->end == 7);
    assert(f->pattern_id == "pdf");
    assert(f->severity == scrub_sev_high);
    f = pdf.scan(data, f->end);
    assert(f);
    assert(f->start == 16);
    assert(!pdf.scan(data, f->end));
    assert(!pdf.scan(data, 1000));
    assert(!pdf.scan("", 0));

    bool thrown = false;
    try {
        ScrubSignatureDetector("empty", "", scrub_sev_low, 1.0, "nothing");
    } catch (std::logic_error&) {
        thrown = true;
    }
    assert(thrown);
}

static void
test_regex()
{
    auto email = find_builtin("email");
    assert(email->getInput() == ScrubDetector::i_text);
    std::string data = "mail a@b.co and c.d@example.org";
    auto f = email->scan(data, 0);
    assert(f);
    assert(data.substr(f->start, f->end - f->start) == "a@b.co");
    f = email->scan(data, f->end);
    assert(f);
    assert(data.substr(f->start, f->end - f->start) == "c.d@example.org");
    assert(!email->scan(data, f->end));

    // Word boundaries see the byte before the starting offset.
    ScrubRegexDetector word("word", R"(\bab)", scrub_sev_low, 1.0, "word", scrub_pt_custom);
    assert(!word.scan("xab", 1));
    assert(word.scan("x ab", 2)->start == 2);
    assert(word.scan("ab", 0)->start == 0);

    // Empty matches are skipped.
    ScrubRegexDetector star("star", "a*", scrub_sev_low, 1.0, "star");
    f = star.scan("bbab", 0);
    assert(f);
    assert(f->start == 2);
    assert(f->end == 3);
    assert(!star.scan("bbb", 0));

    // Bytes are matched as Latin-1, so offsets are byte offsets.
    std::string binary("\xfe\xff\x00" "a@b.co", 9);
    f = email->scan(binary, 0);
    assert(f);
    assert(f->start == 3);
    assert(f->end == binary.size());

    std::string long_run(200000, '7');
    assert(!find_builtin("phone")->scan(long_run, 0));

    bool thrown = false;
    try {
        ScrubRegexDetector bad("bad", "([a-", scrub_sev_low, 1.0, "bad");
    } catch (ScrubExc& e) {
        assert(e.getErrorCode() == scrub_e_pattern);
        assert(e.getObject() == "bad");
        thrown = true;
    }
    assert(thrown);
}

static void
test_builtins()
{
    auto signatures = ScrubDetector::builtinSignatures();
    auto patterns = ScrubDetector::builtinPatterns();
    assert(signatures.size() == 9);
    assert(patterns.size() == 6);

    assert(find_builtin("pe")->getSeverity() == scrub_sev_critical);
    assert(find_builtin("pe")->getConfidence() == 0.5);
    assert(find_builtin("xpacket")->getKind() == scrub_pt_metadata);
    assert(find_builtin("email")->getSeverity() == scrub_sev_high);

    assert(first_match("jpeg", std::string("..\xff\xd8\xff\xe0..")) == "\xff\xd8\xff");
    assert(first_match("elf", std::string("\0\x7f" "ELF\2", 5)) == "\x7f" "ELF");
    assert(first_match("gzip", "\x1f\x8b\x08\x00") == "\x1f\x8b\x08");
    assert(first_match("xmpmeta", "<x:xmpmeta xmlns:x='adobe:ns:meta/'>") == "<x:xmpmeta");

    assert(first_match("phone", "call 555-123-4567 today") == "555-123-4567");
    assert(first_match("ssn", "ssn 123-45-6789") == "123-45-6789");
    assert(first_match("credit_card", "card 4111 1111 1111 1111.") == "4111 1111 1111 1111");
    assert(first_match("ipv4", "host 10.0.0.254:80") == "10.0.0.254");
    assert(first_match("url", "see https://example.com/x?y=1 (now)") == "https://example.com/x?y=1");
    assert(first_match("url", "or www.example.org") == "www.example.org");
    assert(first_match("email", "no address here @ all").empty());
    // Digits inside a longer run are not phone numbers.
    assert(first_match("phone", "id 12345551234567").empty());
}

static void
test_unparse()
{
    std::string data = "Contact test@example.com now";
    auto f = find_builtin("email")->scan(data, 0);
    assert(f);
    f->og = ScrubObjGen(3);
    assert(f->unparse() == "high content email (confidence 0.9) in 3 0 R: email address");
    f->og.reset();
    f->kind = scrub_pt_metadata;
    assert(f->unparse() == "high metadata email (confidence 0.9): email address");
    assert(std::string(ScrubFinding::kindName(scrub_pt_steganography)) == "steganography");
    assert(std::string(ScrubFinding::severityName(scrub_sev_info)) == "info");
}

int
main()
{
    test_signature();
    test_regex();
    test_builtins();
    test_unparse();
    std::cout << "detector tests passed" << std::endl;
    return 0;
}
