#include <pdfscrub/assert_test.h>

#include <pdfscrub/ScrubTokenizer.hh>

#include <iostream>

using Token = ScrubTokenizer::Token;

static char const*
tt_name(ScrubTokenizer::token_type_e type)
{
    switch (type) {
    case ScrubTokenizer::tt_bad:
        return "bad";
    case ScrubTokenizer::tt_array_close:
        return "array_close";
    case ScrubTokenizer::tt_array_open:
        return "array_open";
    case ScrubTokenizer::tt_brace_close:
        return "brace_close";
    case ScrubTokenizer::tt_brace_open:
        return "brace_open";
    case ScrubTokenizer::tt_dict_close:
        return "dict_close";
    case ScrubTokenizer::tt_dict_open:
        return "dict_open";
    case ScrubTokenizer::tt_integer:
        return "integer";
    case ScrubTokenizer::tt_name:
        return "name";
    case ScrubTokenizer::tt_real:
        return "real";
    case ScrubTokenizer::tt_string:
        return "string";
    case ScrubTokenizer::tt_null:
        return "null";
    case ScrubTokenizer::tt_bool:
        return "bool";
    case ScrubTokenizer::tt_word:
        return "word";
    case ScrubTokenizer::tt_eof:
        return "eof";
    case ScrubTokenizer::tt_space:
        return "space";
    case ScrubTokenizer::tt_comment:
        return "comment";
    case ScrubTokenizer::tt_inline_image:
        return "inline-image";
    }
    return "unknown";
}

// Render the token stream as type:value pairs so whole sequences can
// be compared at once.
static std::string
dump(std::string const& data, bool include_ignorable = false)
{
    std::string result;
    for (auto const& token: ScrubTokenizer::tokenize(data, include_ignorable)) {
        if (!result.empty()) {
            result += " ";
        }
        result += std::string(tt_name(token.getType())) + ":" + token.getValue();
    }
    return result;
}

static void
test_scalars()
{
    assert(dump("12 -3 +4 1.5 -.25 4. true false null") ==
           "integer:12 integer:-3 integer:+4 real:1.5 real:-.25 real:4. "
           "bool:true bool:false null:null");
    assert(dump("1.2.3 -- Tf") == "word:1.2.3 word:-- word:Tf");
    assert(dump("[/A{}]<<>>") ==
           "array_open:[ name:/A brace_open:{ brace_close:} array_close:] "
           "dict_open:<< dict_close:>>");
}

static void
test_names()
{
    auto tokens = ScrubTokenizer::tokenize("/One#20Two /Hash#2 /F1/F2");
    assert(tokens.size() == 4);
    assert(tokens.at(0).getValue() == "/One Two");
    assert(tokens.at(0).getRawValue() == "/One#20Two");
    // An incomplete escape is kept as is.
    assert(tokens.at(1).getValue() == "/Hash#2");
    assert(tokens.at(2).getValue() == "/F1");
    assert(tokens.at(3).getValue() == "/F2");
}

static void
test_strings()
{
    auto tokens = ScrubTokenizer::tokenize("(a\\(b\\)c) (x(y)z) (\\101\\n\\\\) (one\\\ntwo)");
    assert(tokens.size() == 4);
    assert(tokens.at(0).getValue() == "a(b)c");
    assert(tokens.at(0).getRawValue() == "(a\\(b\\)c)");
    assert(tokens.at(1).getValue() == "x(y)z");
    assert(tokens.at(2).getValue() == "A\n\\");
    assert(tokens.at(3).getValue() == "onetwo");

    tokens = ScrubTokenizer::tokenize("<48 65 6C6c6f> <7>");
    assert(tokens.size() == 2);
    assert(tokens.at(0).getType() == ScrubTokenizer::tt_string);
    assert(tokens.at(0).getValue() == "Hello");
    assert(tokens.at(1).getValue() == "p");

    // Tokens built from values get a raw value that can be reparsed.
    Token t(ScrubTokenizer::tt_string, "a)b");
    tokens = ScrubTokenizer::tokenize(t.getRawValue());
    assert(tokens.size() == 1);
    assert(tokens.at(0) == t);
}

static void
test_ignorable()
{
    assert(dump("q %comment\n1 0 0 1 0 0 cm") ==
           "word:q integer:1 integer:0 integer:0 integer:1 integer:0 integer:0 word:cm");
    assert(dump("q %comment\nQ", true) == "word:q space:  comment:%comment space:\n word:Q");
    // NUL counts as white space.
    assert(dump(std::string("q\0Q", 3)) == "word:q word:Q");
}

static void
test_inline_image()
{
    std::string content = "BI /W 2 /H 1 ID \x01" "EIx\x02 EI Q";
    auto tokens = ScrubTokenizer::tokenize(content);
    assert(tokens.size() == 9);
    assert(tokens.at(5).isWord("ID"));
    assert(tokens.at(6).getType() == ScrubTokenizer::tt_inline_image);
    // EI inside the data is not preceded by white space.
    assert(tokens.at(6).getValue() == "\x01" "EIx\x02 ");
    assert(tokens.at(7).isWord("EI"));
    assert(tokens.at(8).isWord("Q"));

    tokens = ScrubTokenizer::tokenize("BI ID abc");
    assert(tokens.size() == 3);
    assert(tokens.back().getType() == ScrubTokenizer::tt_bad);
}

static void
test_bad()
{
    auto tokens = ScrubTokenizer::tokenize("q (unterminated");
    assert(tokens.size() == 2);
    assert(tokens.at(1).getType() == ScrubTokenizer::tt_bad);
    assert(tokens.at(1).getErrorMessage() == "unterminated string");

    // Nothing is returned after the first bad token.
    tokens = ScrubTokenizer::tokenize("q ) Q");
    assert(tokens.size() == 2);
    assert(tokens.at(1).getType() == ScrubTokenizer::tt_bad);

    tokens = ScrubTokenizer::tokenize("<12 zz>");
    assert(tokens.size() == 1);
    assert(tokens.at(0).getErrorMessage() == "invalid character in hexstring");

    // Bad tokens never compare equal.
    assert(!(tokens.at(0) == tokens.at(0)));

    ScrubTokenizer tokenizer("x");
    assert(tokenizer.readToken().isWord("x"));
    assert(tokenizer.getOffset() == 1);
    assert(tokenizer.readToken().getType() == ScrubTokenizer::tt_eof);
}

int
main()
{
    test_scalars();
    test_names();
    test_strings();
    test_ignorable();
    test_inline_image();
    test_bad();
    std::cout << "tokenizer tests passed" << std::endl;
    return 0;
}
