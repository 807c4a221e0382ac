#include <versewall/poem/PoemContent.hpp>
#include <versewall/text/Utf8.hpp>

namespace VW::Poem {
namespace {

using json = nlohmann::json;

auto string_field(json const& object, char const* key) -> std::string {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

auto trimmed(std::string_view line) -> std::string {
    auto decoded = Text::decode_utf8(line);
    return Text::encode_utf8(Text::trim(decoded));
}

} // namespace

auto main_text(PoemContent const& poem, bool show_full_poem) -> std::string {
    if (show_full_poem) {
        std::string joined;
        for (auto const& line : poem.origin.content) {
            auto clean = trimmed(line);
            if (clean.empty()) {
                continue;
            }
            if (!joined.empty()) {
                joined.push_back('\n');
            }
            joined += clean;
        }
        if (!joined.empty()) {
            return joined;
        }
    }
    return poem.content;
}

auto to_poem_text(PoemContent const& poem, bool show_full_poem) -> Scene::PoemText {
    return Scene::PoemText{
        .main_text = main_text(poem, show_full_poem),
        .title = poem.origin.title,
        .author = poem.origin.author,
    };
}

auto fallback_poem() -> PoemContent {
    PoemContent poem;
    poem.content = "如果不去遍历世界，我们就不知道什么是我们精神和情感的寄托，"
                   "但我们一旦遍历了世界，却发现我们可以承担的，往往只有自己的心灵。";
    poem.origin.title = "旅行";
    poem.origin.author = "测试";
    poem.origin.dynasty = "现代";
    return poem;
}

auto poem_to_json(PoemContent const& poem) -> json {
    return json{
        {"content", poem.content},
        {"origin",
         {{"title", poem.origin.title},
          {"author", poem.origin.author},
          {"dynasty", poem.origin.dynasty},
          {"content", poem.origin.content}}},
    };
}

auto poem_from_json(json const& document) -> Expected<PoemContent> {
    if (!document.is_object()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "poem must be a JSON object"});
    }
    auto const* body = &document;
    if (auto data = document.find("data"); data != document.end() && data->is_object()) {
        body = &*data;
    }

    PoemContent poem;
    poem.content = string_field(*body, "content");
    if (auto origin = body->find("origin"); origin != body->end() && origin->is_object()) {
        poem.origin.title = string_field(*origin, "title");
        poem.origin.author = string_field(*origin, "author");
        poem.origin.dynasty = string_field(*origin, "dynasty");
        if (auto lines = origin->find("content"); lines != origin->end() && lines->is_array()) {
            for (auto const& line : *lines) {
                if (line.is_string()) {
                    poem.origin.content.push_back(line.get<std::string>());
                }
            }
        }
    }
    if (poem.content.empty() && poem.origin.content.empty()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "poem has no text"});
    }
    return poem;
}

auto parse_poem(std::string_view text) -> Expected<PoemContent> {
    auto document = json::parse(text, nullptr, false);
    if (document.is_discarded()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "poem is not valid JSON"});
    }
    return poem_from_json(document);
}

} // namespace VW::Poem
