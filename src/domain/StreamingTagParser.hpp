#pragma once

#include <functional>
#include <map>
#include <string>

namespace psyche::domain {

/**
 * @brief Incremental parser for action tags embedded in a streamed model reply.
 *
 * Recognizes `<action key="value">body</action>` and `<action key="value"/>`
 * for registered action names. Text outside tags is reported as free text.
 * Chunks may split tags and closing markers at any byte. A '<' that does not
 * open a well-formed action tag is emitted as text and scanning resumes right
 * after it, so a stray '<' never hides a later tag.
 */
class StreamingTagParser {
public:
    enum class State {
        SeekingTag,
        ParsingAttributes,
        StreamingBody
    };

    using Attributes = std::map<std::string, std::string>;

    struct Callbacks {
        std::function<void(const std::string& action, const Attributes& attributes)> onOpen;
        std::function<void(const std::string& chunk)> onBody;
        std::function<void(const std::string& action, const Attributes& attributes, const std::string& body)> onClose;
        std::function<void(const std::string& text)> onText;
        std::function<void(const std::string& reason)> onMalformed;
    };

    /** @brief Predicate deciding whether a lower-cased tag name is a known action. */
    using ActionFilter = std::function<bool(const std::string& name)>;

    /** Tags longer than this without a closing '>' are treated as text. */
    static constexpr size_t kMaxTagLength = 256;

    StreamingTagParser(ActionFilter isAction, Callbacks callbacks);

    /** @brief Consumes the next chunk of the stream. */
    void feed(const std::string& chunk);

    /** @brief Flushes buffered text and implicitly closes an open tag. */
    void finish();

    State state() const { return m_state; }
    size_t completedTags() const { return m_completed; }
    size_t malformedTags() const { return m_malformed; }

private:
    bool step();
    bool seekTag();
    bool parseTag();
    bool streamBody();
    bool rejectOpening();

    void emitText(const std::string& text);
    void emitBody(const std::string& chunk);
    void malformed(const std::string& reason);
    void closeTag();

    ActionFilter m_isAction;
    Callbacks m_callbacks;

    State m_state = State::SeekingTag;
    std::string m_buffer;
    std::string m_action;
    Attributes m_attributes;
    std::string m_body;
    std::string m_closing;
    size_t m_completed = 0;
    size_t m_malformed = 0;
};

} // namespace psyche::domain
