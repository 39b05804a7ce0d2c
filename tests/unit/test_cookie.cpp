#include "sticky/protocol/Cookie.h"
#include "sticky/common/Logger.h"

#include <cassert>

using namespace sticky::protocol;

void testGetCookieValue() {
    assert(GetCookieValue("a=1; b=2; c=3", "b") == "2");
    assert(GetCookieValue("sid=abc123", "sid") == "abc123");
    assert(GetCookieValue(" sid = x y ; other=z ", "sid") == "x y");
    assert(GetCookieValue("a=1; b=2", "missing").empty());
    assert(GetCookieValue("", "a").empty());
    assert(GetCookieValue("a=1", "").empty());
    assert(GetCookieValue("_TRAEFIK_BACKEND=\"http://1.2.3.4\"", "_TRAEFIK_BACKEND") == "http://1.2.3.4");
    LOG_INFO << "GetCookieValue PASS";
}

void testFindCookieTellsEmptyFromAbsent() {
    auto empty = FindCookie("a=1; _TRAEFIK_BACKEND=", "_TRAEFIK_BACKEND");
    assert(empty.has_value());
    assert(empty->empty());

    assert(!FindCookie("a=1; b=2", "_TRAEFIK_BACKEND").has_value());
    assert(!FindCookie("_TRAEFIK_BACKEND", "_TRAEFIK_BACKEND").has_value());
    assert(*FindCookie("x=1;;  _TRAEFIK_BACKEND=http://0.0.0.2", "_TRAEFIK_BACKEND") == "http://0.0.0.2");
    LOG_INFO << "FindCookie PASS";
}

void testParseSetCookiePair() {
    auto p = ParseSetCookiePair("_TRAEFIK_BACKEND=http://1.2.3.4");
    assert(p && p->first == "_TRAEFIK_BACKEND" && p->second == "http://1.2.3.4");

    p = ParseSetCookiePair("  _TRAEFIK_BACKEND=http://1.2.3.4; Path=/path; HttpOnly  ");
    assert(p && p->second == "http://1.2.3.4");

    // Only the first '=' separates name and value.
    p = ParseSetCookiePair("token=a=b==; Secure");
    assert(p && p->first == "token" && p->second == "a=b==");

    p = ParseSetCookiePair("empty=; Max-Age=0");
    assert(p && p->first == "empty" && p->second.empty());

    assert(!ParseSetCookiePair("").has_value());
    assert(!ParseSetCookiePair("   ").has_value());
    assert(!ParseSetCookiePair("novalue; Path=/").has_value());
    assert(!ParseSetCookiePair("; a=b").has_value());
    LOG_INFO << "ParseSetCookiePair PASS";
}

void testFindSetCookieValue() {
    const std::string name = "_TRAEFIK_BACKEND";

    assert(!FindSetCookieValue({}, name).has_value());
    assert(!FindSetCookieValue({"", "garbage", "other=1"}, name).has_value());

    auto v = FindSetCookieValue({"other=1; Path=/", "_TRAEFIK_BACKEND=http://1.2.3.4; Path=/path"}, name);
    assert(v && *v == "http://1.2.3.4");

    // The first matching line decides, even when a later one differs.
    v = FindSetCookieValue({"_TRAEFIK_BACKEND=first", "_TRAEFIK_BACKEND=second"}, name);
    assert(v && *v == "first");

    v = FindSetCookieValue({"_TRAEFIK_BACKEND=; Path=/", "_TRAEFIK_BACKEND=second"}, name);
    assert(v && v->empty());

    // Names are case-sensitive.
    assert(!FindSetCookieValue({"_traefik_backend=x"}, name).has_value());
    LOG_INFO << "FindSetCookieValue PASS";
}

void testCookieSerialization() {
    Cookie c("_TRAEFIK_BACKEND", "http://1.2.3.4");
    assert(c.toRequestPair() == "_TRAEFIK_BACKEND=http://1.2.3.4");
    assert(c.toSetCookieString() == "_TRAEFIK_BACKEND=http://1.2.3.4");

    c.path = "/";
    assert(c.toSetCookieString() == "_TRAEFIK_BACKEND=http://1.2.3.4; Path=/");

    Cookie expired("_TRAEFIK_BACKEND", "");
    expired.path = "/socket.io";
    expired.expires = "Thu, 01 Jan 1970 00:00:00 GMT";
    expired.maxAge = 0;
    assert(expired.toSetCookieString() ==
           "_TRAEFIK_BACKEND=; Path=/socket.io; Expires=Thu, 01 Jan 1970 00:00:00 GMT; Max-Age=0");
    LOG_INFO << "Cookie serialization PASS";
}

void testSanitizeCookieValue() {
    assert(SanitizeCookieValue("http://1.2.3.4") == "http://1.2.3.4");
    assert(SanitizeCookieValue("a;b\"c\\d") == "abcd");
    assert(SanitizeCookieValue("a\r\nb") == "ab");
    assert(SanitizeCookieValue("two words") == "\"two words\"");
    assert(SanitizeCookieValue("a,b") == "\"a,b\"");
    LOG_INFO << "SanitizeCookieValue PASS";
}

int main() {
    sticky::common::Logger::Instance().SetLevel(sticky::common::LogLevel::INFO);

    testGetCookieValue();
    testFindCookieTellsEmptyFromAbsent();
    testParseSetCookiePair();
    testFindSetCookieValue();
    testCookieSerialization();
    testSanitizeCookieValue();
    return 0;
}
