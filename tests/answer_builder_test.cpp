#include "../src/core/AnswerBuilder.hpp"

#include <cassert>
#include <string>

static SHttpResponse challengeResponse(const std::string& url) {
    SHttpResponse resp;
    resp.code        = 503;
    resp.request.url = url;
    resp.request.headers.add("User-Agent", "unit-test/1.0");
    resp.request.headers.add("Accept", "text/html");
    resp.request.headers.add("Cookie", "__cfduid=d41d8cd98f");
    return resp;
}

static SExtractedChallenge challenge() {
    SExtractedChallenge c;
    c.script            = "1";
    c.verificationToken = "1b2a3c4d5e6f7a8b9c0d1e2f3a4b5c6d";
    c.passToken         = "1524395720.123-AbCdEf/Gh+=";
    return c;
}

int main() {
    assert(CAnswerBuilder::formatAnswer(-143) == "-143.0000000000");
    assert(CAnswerBuilder::formatAnswer(12345.6) == "12345.6000000000");
    assert(CAnswerBuilder::formatAnswer(0.5) == "0.5000000000");

    // the verification request
    {
        auto req = CAnswerBuilder().build(challenge(), -143, challengeResponse("http://example.com/some/page?x=1"));
        assert(req.has_value());

        assert(req->method == "GET");
        assert(req->url == "http://example.com/cdn-cgi/l/chk_jschl?jschl_answer=-143.0000000000&jschl_vc=1b2a3c4d5e6f7a8b9c0d1e2f3a4b5c6d&pass=1524395720.123-AbCdEf%2FGh%2B%3D");
        assert(req->body.empty());

        assert(req->headers.get("User-Agent") == "unit-test/1.0");
        assert(req->headers.get("accept") == "text/html");
        assert(req->headers.get("Cookie") == "__cfduid=d41d8cd98f");
        assert(req->headers.get("Referer") == "http://example.com/some/page?x=1");
        assert(req->headers.getAll("Referer").size() == 1);
    }

    // scheme and port are kept, a previous referer is replaced
    {
        auto resp = challengeResponse("https://Example.com:8443/a#frag");
        resp.request.headers.add("Referer", "http://elsewhere.test/");

        auto req = CAnswerBuilder().build(challenge(), 1.25, resp);
        assert(req.has_value());
        assert(req->url.starts_with("https://Example.com:8443/cdn-cgi/l/chk_jschl?jschl_answer=1.2500000000&"));
        assert(req->url.find('#') == std::string::npos);
        assert(req->headers.get("Referer") == "https://Example.com:8443/a#frag");
        assert(req->headers.getAll("Referer").size() == 1);
    }

    // no pass token, no pass parameter
    {
        auto c = challenge();
        c.passToken.reset();

        auto req = CAnswerBuilder().build(c, 2, challengeResponse("http://example.com/"));
        assert(req.has_value());
        assert(req->url == "http://example.com/cdn-cgi/l/chk_jschl?jschl_answer=2.0000000000&jschl_vc=1b2a3c4d5e6f7a8b9c0d1e2f3a4b5c6d");
    }

    // no verification token
    {
        auto c = challenge();
        c.verificationToken.reset();

        auto strict = CAnswerBuilder(true).build(c, 2, challengeResponse("http://example.com/"));
        assert(!strict.has_value());
        assert(strict.error().kind == ERROR_MALFORMED);

        auto lenient = CAnswerBuilder(false).build(c, 2, challengeResponse("http://example.com/"));
        assert(lenient.has_value());
        assert(lenient->url == "http://example.com/cdn-cgi/l/chk_jschl?jschl_answer=2.0000000000&pass=1524395720.123-AbCdEf%2FGh%2B%3D");
    }

    // nothing to resolve against
    {
        auto req = CAnswerBuilder().build(challenge(), 2, challengeResponse("not a url"));
        assert(!req.has_value());
        assert(req.error().kind == ERROR_INVALID_REQUEST);
    }

    return 0;
}
