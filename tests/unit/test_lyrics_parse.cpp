#include "wrapmgr/catalog/CatalogClient.h"
#include "wrapmgr/common/JsonLite.h"
#include "wrapmgr/common/Logger.h"

#include <cassert>
#include <string>

using wrapmgr::catalog::CatalogClient;
using wrapmgr::catalog::LyricsOutcome;
namespace json = wrapmgr::common::json;

int main() {
    wrapmgr::common::Logger::Instance().SetLevel(wrapmgr::common::LogLevel::INFO);

    // JSON helpers
    {
        const std::string doc = "{\"a\": {\"b\": [1, {\"c\": \"x\\ny\\u0041\"}]}, \"n\": null}";
        size_t pos = 0;
        assert(json::FindPath(doc, {"a", "b", "1", "c"}, &pos));
        std::string s;
        assert(json::ParseString(doc, pos, &s));
        assert(s == "x\nyA");
        assert(json::FindPath(doc, {"n"}, &pos));
        assert(json::IsNull(doc, pos));
        assert(!json::FindPath(doc, {"a", "b", "5"}, &pos));
        assert(!json::FindPath(doc, {"missing"}, &pos));
        assert(json::Escape("q\"\\\n") == "q\\\"\\\\\\n");
    }

    // Catalog path with bracketed query keys percent-encoded.
    {
        const std::string path = CatalogClient::LyricsPath("jp", "1440818839", "ja");
        assert(path == "/v1/catalog/jp/songs/1440818839/syllable-lyrics"
                       "?l%5Blyrics%5D=ja&extend=ttmlLocalizations&l%5Bscript%5D=en-Latn");
        assert(CatalogClient::UrlEncode("en-US a/b") == "en-US%20a%2Fb");
    }

    // Success: the TTML document comes back verbatim.
    {
        const std::string body =
            "{\"data\": [{\"id\": \"1\", \"type\": \"syllable-lyrics\", "
            "\"attributes\": {\"ttmlLocalizations\": \"<tt xmlns=\\\"http://www.w3.org/ns/ttml\\\"></tt>\"}}]}";
        LyricsOutcome out = CatalogClient::ParseLyrics(200, body);
        assert(out.ok);
        assert(out.ttml == "<tt xmlns=\"http://www.w3.org/ns/ttml\"></tt>");
    }

    // Failures
    {
        LyricsOutcome out = CatalogClient::ParseLyrics(404, "{}");
        assert(!out.ok && out.error == "Lyrics API failed: HTTP 404");

        out = CatalogClient::ParseLyrics(200, "{\"errors\": [{\"status\": \"401\"}]}");
        assert(!out.ok && out.error == "API error: [{\"status\": \"401\"}]");

        out = CatalogClient::ParseLyrics(200, "{\"data\": []}");
        assert(!out.ok && out.error == "No lyrics found");

        out = CatalogClient::ParseLyrics(200, "{\"data\": [{\"attributes\": {\"ttmlLocalizations\": null}}]}");
        assert(!out.ok && out.error == "No lyrics found");

        out = CatalogClient::ParseLyrics(200, "not json");
        assert(!out.ok);
    }

    LOG_INFO << "LyricsParse: PASS";
    return 0;
}
