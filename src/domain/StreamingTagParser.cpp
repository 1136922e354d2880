#include "domain/StreamingTagParser.hpp"
#include "domain/Identifiers.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace psyche::domain {

namespace {
    bool IsNameChar(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    }

    // Position of the '>' ending the tag header that starts at text[from], skipping
    // quoted values. A '<' met first means the opening '<' was not a tag; its
    // position is returned with stray set.
    size_t FindTagEnd(const std::string& text, size_t from, bool& stray) {
        bool quoted = false;
        stray = false;
        for (size_t i = from; i < text.size(); ++i) {
            if (text[i] == '<') {
                stray = true;
                return i;
            }
            if (text[i] == '"') quoted = !quoted;
            else if (text[i] == '>' && !quoted) return i;
        }
        return std::string::npos;
    }

    size_t FindNoCase(const std::string& haystack, const std::string& needle) {
        if (needle.empty() || haystack.size() < needle.size()) return std::string::npos;
        for (size_t i = 0; i + needle.size() <= haystack.size(); ++i) {
            size_t j = 0;
            while (j < needle.size() &&
                   std::tolower(static_cast<unsigned char>(haystack[i + j])) ==
                   std::tolower(static_cast<unsigned char>(needle[j]))) {
                ++j;
            }
            if (j == needle.size()) return i;
        }
        return std::string::npos;
    }

    // Length of the longest suffix of text that is a proper prefix of marker.
    size_t PartialMarkerSuffix(const std::string& text, const std::string& marker) {
        size_t maxLen = std::min(text.size(), marker.size() - 1);
        for (size_t len = maxLen; len > 0; --len) {
            bool match = true;
            for (size_t k = 0; k < len; ++k) {
                if (std::tolower(static_cast<unsigned char>(text[text.size() - len + k])) !=
                    std::tolower(static_cast<unsigned char>(marker[k]))) {
                    match = false;
                    break;
                }
            }
            if (match) return len;
        }
        return 0;
    }

    // key="value" pairs separated by whitespace.
    bool ParseAttributes(const std::string& text, StreamingTagParser::Attributes& out) {
        size_t i = 0;
        const size_t n = text.size();
        while (true) {
            size_t start = i;
            while (i < n && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
            if (i == n) return true;
            if (i == start) return false;

            size_t keyStart = i;
            while (i < n && IsNameChar(text[i])) ++i;
            if (i == keyStart) return false;
            std::string key = text.substr(keyStart, i - keyStart);

            if (i >= n || text[i] != '=') return false;
            ++i;
            if (i >= n || text[i] != '"') return false;
            ++i;
            size_t close = text.find('"', i);
            if (close == std::string::npos) return false;
            out[key] = text.substr(i, close - i);
            i = close + 1;
        }
    }
}

StreamingTagParser::StreamingTagParser(ActionFilter isAction, Callbacks callbacks)
    : m_isAction(std::move(isAction)), m_callbacks(std::move(callbacks)) {}

void StreamingTagParser::feed(const std::string& chunk) {
    m_buffer += chunk;
    while (step()) {
    }
}

void StreamingTagParser::finish() {
    // A header still open at the end was never a tag: its '<' is text and
    // the rest is parsed again.
    while (true) {
        while (step()) {
        }
        if (m_state != State::ParsingAttributes) break;
        rejectOpening();
    }

    if (m_state == State::StreamingBody) {
        emitBody(m_buffer);
        std::cerr << "[TagParser] Stream ended inside <" << m_action << ">, closing it implicitly" << std::endl;
        closeTag();
    } else {
        emitText(m_buffer);
    }
    m_buffer.clear();
    m_state = State::SeekingTag;
}

bool StreamingTagParser::step() {
    switch (m_state) {
        case State::SeekingTag: return seekTag();
        case State::ParsingAttributes: return parseTag();
        case State::StreamingBody: return streamBody();
    }
    return false;
}

bool StreamingTagParser::seekTag() {
    size_t lt = m_buffer.find('<');
    if (lt == std::string::npos) {
        emitText(m_buffer);
        m_buffer.clear();
        return false;
    }
    if (lt > 0) {
        emitText(m_buffer.substr(0, lt));
        m_buffer.erase(0, lt);
    }
    if (m_buffer.size() < 2) return false;

    char next = m_buffer[1];
    if (IsNameChar(next)) {
        m_state = State::ParsingAttributes;
        return true;
    }

    if (next == '/') {
        size_t gt = m_buffer.find('>');
        if (gt == std::string::npos) {
            if (m_buffer.size() <= kMaxTagLength) return false;
            emitText("<");
            m_buffer.erase(0, 1);
            return true;
        }
        std::string name = m_buffer.substr(2, gt - 2);
        bool validName = !name.empty();
        for (char c : name) validName = validName && IsNameChar(c);
        if (validName) {
            // Closing marker of a tag that was skipped earlier.
            m_buffer.erase(0, gt + 1);
        } else {
            emitText("<");
            m_buffer.erase(0, 1);
        }
        return true;
    }

    emitText("<");
    m_buffer.erase(0, 1);
    return true;
}

bool StreamingTagParser::parseTag() {
    size_t nameEnd = 1;
    while (nameEnd < m_buffer.size() && IsNameChar(m_buffer[nameEnd])) ++nameEnd;
    if (nameEnd == m_buffer.size()) {
        if (m_buffer.size() <= kMaxTagLength) return false;
        return rejectOpening();
    }

    std::string name = ToLower(m_buffer.substr(1, nameEnd - 1));
    char after = m_buffer[nameEnd];

    if (!m_isAction || !m_isAction(name)) {
        // Bare <name> or <name/> of an unknown action is dropped, anything
        // else (2<3, a<b) is plain text.
        size_t end = std::string::npos;
        if (after == '>') {
            end = nameEnd;
        } else if (after == '/') {
            if (nameEnd + 1 == m_buffer.size()) return false;
            if (m_buffer[nameEnd + 1] == '>') end = nameEnd + 1;
        }
        if (end == std::string::npos) return rejectOpening();
        m_buffer.erase(0, end + 1);
        m_state = State::SeekingTag;
        malformed("unknown action <" + name + ">");
        return true;
    }

    if (after != '>' && after != '/' && !std::isspace(static_cast<unsigned char>(after))) {
        return rejectOpening();
    }

    bool stray = false;
    size_t gt = FindTagEnd(m_buffer, nameEnd, stray);
    if (stray) {
        malformed("unterminated <" + name + ">");
        return rejectOpening();
    }
    if (gt == std::string::npos) {
        if (m_buffer.size() <= kMaxTagLength) return false;
        return rejectOpening();
    }

    std::string header = m_buffer.substr(nameEnd, gt - nameEnd);
    m_buffer.erase(0, gt + 1);
    m_state = State::SeekingTag;

    bool selfClosing = !header.empty() && header.back() == '/';
    if (selfClosing) header.pop_back();

    Attributes attributes;
    if (!ParseAttributes(header, attributes)) {
        malformed("malformed attributes in <" + name + ">");
        return true;
    }

    m_action = name;
    m_attributes = std::move(attributes);
    m_body.clear();
    if (m_callbacks.onOpen) m_callbacks.onOpen(m_action, m_attributes);

    if (selfClosing) {
        closeTag();
        return true;
    }

    m_closing = "</" + m_action + ">";
    m_state = State::StreamingBody;
    return true;
}

bool StreamingTagParser::streamBody() {
    size_t pos = FindNoCase(m_buffer, m_closing);
    if (pos != std::string::npos) {
        emitBody(m_buffer.substr(0, pos));
        m_buffer.erase(0, pos + m_closing.size());
        closeTag();
        return true;
    }

    size_t keep = PartialMarkerSuffix(m_buffer, m_closing);
    emitBody(m_buffer.substr(0, m_buffer.size() - keep));
    m_buffer.erase(0, m_buffer.size() - keep);
    return false;
}

bool StreamingTagParser::rejectOpening() {
    emitText("<");
    m_buffer.erase(0, 1);
    m_state = State::SeekingTag;
    return true;
}

void StreamingTagParser::emitText(const std::string& text) {
    if (text.empty()) return;
    if (m_callbacks.onText) m_callbacks.onText(text);
}

void StreamingTagParser::emitBody(const std::string& chunk) {
    if (chunk.empty()) return;
    m_body += chunk;
    if (m_callbacks.onBody) m_callbacks.onBody(chunk);
}

void StreamingTagParser::malformed(const std::string& reason) {
    ++m_malformed;
    std::cerr << "[TagParser] Skipping tag: " << reason << std::endl;
    if (m_callbacks.onMalformed) m_callbacks.onMalformed(reason);
}

void StreamingTagParser::closeTag() {
    ++m_completed;
    if (m_callbacks.onClose) m_callbacks.onClose(m_action, m_attributes, m_body);
    m_action.clear();
    m_attributes.clear();
    m_body.clear();
    m_closing.clear();
    m_state = State::SeekingTag;
}

} // namespace psyche::domain
