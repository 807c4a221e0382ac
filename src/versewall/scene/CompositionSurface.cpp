#include <versewall/scene/CompositionSurface.hpp>
#include <versewall/text/FontFace.hpp>
#include <versewall/text/Utf8.hpp>
#include <versewall/text/VerticalGlyphMap.hpp>

#include <algorithm>
#include <cmath>

namespace VW::Scene {
namespace {

using Text::FontFace;

constexpr double kColumnMargin = 15.0;
constexpr double kFooterGap = 40.0;
constexpr double kContentBottomMargin = 40.0;
constexpr double kTitleStackBottom = 15.0;
constexpr double kTitleFooterGap = 15.0;
constexpr float kSealCornerRadius = 2.0f;
constexpr float kQuoteMarkSize = 16.0f;
constexpr Argb kWhite = rgb(255, 255, 255);

auto is_fragment_break(char32_t c) -> bool {
    switch (c) {
    case U'，':
    case U'。':
    case U'？':
    case U'！':
    case U'；':
    case U',':
    case U'.':
    case U'?':
    case U'!':
    case U';':
    case U'\n':
    case U'\r':
        return true;
    default:
        return false;
    }
}

auto resolve_font(std::shared_ptr<FontFace const> const& font) -> std::shared_ptr<FontFace const> {
    if (font) {
        return font;
    }
    return FontFace::placeholder();
}

auto line_height(FontFace const& font, double size) -> double {
    return (font.ascender_em() - font.descender_em()) * size;
}

auto char_advance(FontFace const& font, char32_t c, double size) -> double {
    return font.advance_em(Text::encode_utf8(c)) * size;
}

auto page_margin(double extent) -> double {
    return std::max(40.0, extent * 0.06);
}

auto align_offset(VerticalAlignment alignment, double slack) -> double {
    switch (alignment) {
    case VerticalAlignment::Top:
        return 0.0;
    case VerticalAlignment::Bottom:
        return slack;
    case VerticalAlignment::Center:
        break;
    }
    return slack * 0.5;
}

auto align_x(HorizontalAlignment alignment, double canvas_width, double block_width) -> double {
    auto margin = page_margin(canvas_width);
    switch (alignment) {
    case HorizontalAlignment::Left:
        return margin;
    case HorizontalAlignment::Right:
        return canvas_width - margin - block_width;
    case HorizontalAlignment::Center:
        break;
    }
    return (canvas_width - block_width) * 0.5;
}

// Accumulates glyphs that share font, size, weight and color.
class RunBuilder {
public:
    RunBuilder(std::shared_ptr<FontFace const> font, double size, Argb color, bool bold)
        : font_(std::move(font)), size_(size) {
        run_.font = font_;
        run_.font_size = static_cast<float>(size);
        run_.synthetic_bold = bold;
        run_.color = to_float(color);
    }

    auto add(char32_t c, double x, double baseline) -> double {
        auto pen = x;
        for (auto const& glyph : font_->shape(Text::encode_utf8(c))) {
            run_.glyphs.push_back(PositionedGlyph{
                glyph.glyph_id,
                static_cast<float>(pen + glyph.x_offset * size_),
                static_cast<float>(baseline + glyph.y_offset * size_),
            });
            pen += glyph.x_advance * size_;
        }
        return pen - x;
    }

    auto ascent() const -> double { return font_->ascender_em() * size_; }

    auto flush(DrawList& list) -> void {
        if (!run_.glyphs.empty()) {
            list.commands.emplace_back(std::move(run_));
        }
    }

private:
    std::shared_ptr<FontFace const> font_;
    double size_;
    GlyphRunCommand run_;
};

struct StackItem {
    char32_t ch = 0;
    double size = 0.0;
    double advance = 0.0;
    double margin_top = 0.0;
    double margin_bottom = 0.0;
};

auto stack_height(std::vector<StackItem> const& items, double line_height_per_em) -> double {
    double total = 0.0;
    for (auto const& item : items) {
        total += item.margin_top + item.size * line_height_per_em + item.margin_bottom;
    }
    return total;
}

auto stack_width(std::vector<StackItem> const& items) -> double {
    double width = 0.0;
    for (auto const& item : items) {
        width = std::max(width, item.advance);
    }
    return width;
}

// Draws a centered vertical stack of single characters; items of different sizes are allowed.
auto draw_stack(DrawList& list,
                std::vector<StackItem> const& items,
                std::shared_ptr<FontFace const> const& font,
                Argb color,
                bool bold,
                double x,
                double width,
                double top) -> void {
    auto lh_em = font->ascender_em() - font->descender_em();
    auto y = top;
    for (auto const& item : items) {
        RunBuilder run(font, item.size, color, bold);
        y += item.margin_top;
        run.add(item.ch, x + (width - item.advance) * 0.5, y + run.ascent());
        y += item.size * lh_em + item.margin_bottom;
        run.flush(list);
    }
}

auto seal_command(double x, double y, double w, double h) -> RoundedRectCommand {
    RoundedRectCommand seal;
    seal.min_x = static_cast<float>(x);
    seal.min_y = static_cast<float>(y);
    seal.max_x = static_cast<float>(x + w);
    seal.max_y = static_cast<float>(y + h);
    seal.radius = kSealCornerRadius;
    seal.color = to_float(kSealColor);
    return seal;
}

auto compose_vertical(DrawList& list, SceneInputs const& inputs, Argb text_color, Argb secondary, double w, double h) -> void {
    auto const& style = inputs.style;
    auto poem_font = resolve_font(style.poem_font);
    auto author_font = resolve_font(style.author_font);
    auto ps = static_cast<double>(style.poem_font_size);
    auto as = static_cast<double>(style.author_font_size);
    auto vsp = static_cast<double>(style.vertical_character_spacing);
    auto cell = line_height(*poem_font, ps) + 2.0 * vsp;

    struct Column {
        std::u32string chars;
        std::vector<double> advances;
        double width = 0.0;
        double height = 0.0;
    };
    std::vector<Column> columns;
    for (auto const& fragment : split_fragments(Text::decode_utf8(inputs.poem.main_text))) {
        Column column;
        for (auto c : fragment) {
            if (c == U'、') {
                continue;
            }
            auto mapped = Text::vertical_form(c);
            column.chars.push_back(mapped);
            column.advances.push_back(char_advance(*poem_font, mapped, ps));
        }
        if (column.chars.empty()) {
            continue;
        }
        column.width = *std::max_element(column.advances.begin(), column.advances.end());
        column.height = cell * static_cast<double>(column.chars.size());
        columns.push_back(std::move(column));
    }

    auto author_lh_em = author_font->ascender_em() - author_font->descender_em();
    std::vector<StackItem> title_items;
    auto title = Text::decode_utf8(inputs.poem.title);
    if (!title.empty()) {
        title_items.push_back({U'﹁', kQuoteMarkSize, char_advance(*author_font, U'﹁', kQuoteMarkSize), 0.0, 5.0});
        for (auto c : title) {
            auto mapped = Text::vertical_form(c);
            title_items.push_back({mapped, as, char_advance(*author_font, mapped, as), 1.0, 1.0});
        }
        title_items.push_back({U'﹂', as, char_advance(*author_font, U'﹂', as), 5.0, 0.0});
    }
    std::vector<StackItem> seal_items;
    auto seal_size = std::max(10.0, as * 0.8);
    for (auto c : Text::decode_utf8(inputs.poem.author)) {
        seal_items.push_back({c, seal_size, char_advance(*author_font, c, seal_size), 1.0, 1.0});
    }

    auto title_w = stack_width(title_items);
    auto title_h = title_items.empty() ? 0.0 : stack_height(title_items, author_lh_em) + kTitleStackBottom;
    auto seal_w = seal_items.empty() ? 0.0 : stack_width(seal_items) + 8.0;
    auto seal_h = seal_items.empty() ? 0.0 : stack_height(seal_items, author_lh_em) + 16.0;
    auto footer_w = std::max(title_w, seal_w);
    auto footer_h = title_h + seal_h;
    auto has_footer = !title_items.empty() || !seal_items.empty();

    double container_w = has_footer ? kFooterGap + footer_w : 0.0;
    double container_h = footer_h;
    for (auto const& column : columns) {
        container_w += column.width + 2.0 * kColumnMargin;
        container_h = std::max(container_h, column.height);
    }

    auto x0 = (w - container_w) * 0.5;
    auto margin = page_margin(h);
    double y0 = (h - container_h) * 0.5;
    if (style.vertical_alignment == VerticalAlignment::Top) {
        y0 = margin;
    } else if (style.vertical_alignment == VerticalAlignment::Bottom) {
        y0 = h - margin - container_h;
    }

    // Columns flow right to left; the first fragment is the rightmost column.
    auto cursor = x0 + container_w;
    for (auto const& column : columns) {
        auto col_x = cursor - kColumnMargin - column.width;
        auto col_y = y0 + align_offset(style.vertical_alignment, container_h - column.height);
        RunBuilder run(poem_font, ps, text_color, false);
        for (std::size_t i = 0; i < column.chars.size(); ++i) {
            auto top = col_y + cell * static_cast<double>(i);
            run.add(column.chars[i], col_x + (column.width - column.advances[i]) * 0.5, top + vsp + run.ascent());
        }
        run.flush(list);
        cursor -= column.width + 2.0 * kColumnMargin;
    }

    if (!has_footer) {
        return;
    }
    auto footer_x = cursor - kFooterGap - footer_w;
    auto footer_y = y0 + align_offset(style.vertical_alignment, container_h - footer_h) + style.vertical_footer_offset;
    if (!title_items.empty()) {
        draw_stack(list, title_items, author_font, secondary, false, footer_x, footer_w, footer_y);
    }
    if (!seal_items.empty()) {
        auto seal_x = footer_x + (footer_w - seal_w) * 0.5;
        auto seal_y = footer_y + title_h;
        list.commands.emplace_back(seal_command(seal_x, seal_y, seal_w, seal_h));
        draw_stack(list, seal_items, author_font, kWhite, true, seal_x + 4.0, seal_w - 8.0, seal_y + 8.0);
    }
}

auto spaced_width(FontFace const& font, std::u32string const& text, double size, double spacing) -> double {
    double width = 0.0;
    for (auto c : text) {
        width += char_advance(font, c, size);
    }
    if (text.size() > 1) {
        width += spacing * static_cast<double>(text.size() - 1);
    }
    return width;
}

auto add_spaced(RunBuilder& run, std::u32string const& text, double x, double baseline, double spacing) -> void {
    auto pen = x;
    for (auto c : text) {
        pen += run.add(c, pen, baseline) + spacing;
    }
}

auto compose_horizontal(DrawList& list, SceneInputs const& inputs, Argb text_color, Argb secondary, double w, double h) -> void {
    auto const& style = inputs.style;
    auto poem_font = resolve_font(style.poem_font);
    auto author_font = resolve_font(style.author_font);
    auto ps = static_cast<double>(style.poem_font_size);
    auto as = static_cast<double>(style.author_font_size);
    auto spacing = static_cast<double>(style.character_spacing);
    auto poem_lh = line_height(*poem_font, ps);

    auto lines = split_fragments(Text::decode_utf8(inputs.poem.main_text));
    std::vector<double> line_widths;
    double content_w = 0.0;
    for (auto const& line : lines) {
        line_widths.push_back(spaced_width(*poem_font, line, ps, spacing));
        content_w = std::max(content_w, line_widths.back());
    }
    auto row = poem_lh + style.line_spacing;
    auto content_h = row * static_cast<double>(lines.size());

    auto title_size = as * 1.2;
    std::u32string title;
    if (!inputs.poem.title.empty()) {
        title = U"「" + Text::decode_utf8(inputs.poem.title) + U"」";
    }
    auto author = Text::decode_utf8(inputs.poem.author);
    auto title_w = title.empty() ? 0.0 : spaced_width(*author_font, title, title_size, 1.0);
    auto title_h = title.empty() ? 0.0 : line_height(*author_font, title_size);
    auto seal_w = author.empty() ? 0.0 : spaced_width(*author_font, author, as, 1.0) + 16.0;
    auto seal_h = author.empty() ? 0.0 : line_height(*author_font, as) + 8.0;
    auto footer_w = (title.empty() ? 0.0 : title_w + (author.empty() ? 0.0 : kTitleFooterGap)) + seal_w;
    auto footer_h = std::max(title_h, seal_h);
    auto has_footer = !title.empty() || !author.empty();

    auto total_h = content_h + (has_footer ? kContentBottomMargin + footer_h : 0.0);
    auto y0 = (h - total_h) * 0.5;

    auto content_x = align_x(style.horizontal_alignment, w, content_w);
    RunBuilder run(poem_font, ps, text_color, false);
    for (std::size_t i = 0; i < lines.size(); ++i) {
        auto line_x = content_x + (content_w - line_widths[i]) * 0.5;
        auto top = y0 + row * static_cast<double>(i);
        add_spaced(run, lines[i], line_x, top + run.ascent(), spacing);
    }
    run.flush(list);

    if (!has_footer) {
        return;
    }
    auto footer_x = align_x(style.horizontal_alignment, w, footer_w) + style.horizontal_footer_offset;
    auto footer_y = y0 + content_h + kContentBottomMargin;
    if (!title.empty()) {
        RunBuilder title_run(author_font, title_size, secondary, false);
        auto top = footer_y + (footer_h - title_h) * 0.5;
        add_spaced(title_run, title, footer_x, top + title_run.ascent(), 1.0);
        title_run.flush(list);
        footer_x += title_w + kTitleFooterGap;
    }
    if (!author.empty()) {
        auto seal_y = footer_y + (footer_h - seal_h) * 0.5;
        list.commands.emplace_back(seal_command(footer_x, seal_y, seal_w, seal_h));
        RunBuilder seal_run(author_font, as, kWhite, true);
        add_spaced(seal_run, author, footer_x + 8.0, seal_y + 4.0 + seal_run.ascent(), 1.0);
        seal_run.flush(list);
    }
}

auto compose_watermark(DrawList& list, SceneInputs const& inputs, double w, double h) -> void {
    if (!inputs.watermark || inputs.watermark->empty()) {
        return;
    }
    auto chars = Text::decode_utf8(*inputs.watermark);
    auto metrics = watermark_metrics(chars.size(), w, h);
    auto font = resolve_font(inputs.style.author_font);
    auto color = with_alpha(inputs.dark_theme ? rgb(255, 255, 255) : rgb(0, 0, 0), 26);
    RunBuilder run(font, metrics.font_size, color, false);
    auto glyph_center = (font->ascender_em() + font->descender_em()) * 0.5 * metrics.font_size;
    for (std::size_t i = 0; i < chars.size(); ++i) {
        auto advance = char_advance(*font, chars[i], metrics.font_size);
        auto x = w - metrics.right_margin - advance;
        auto line_top = metrics.top + metrics.nudge + metrics.line_height * static_cast<double>(i);
        run.add(chars[i], x, line_top + metrics.line_height * 0.5 + glyph_center);
    }
    run.flush(list);
}

auto translated(PathGeometry path, double dy) -> PathGeometry {
    for (auto& point : path.points) {
        point.y += dy;
    }
    return path;
}

} // namespace

auto split_fragments(std::u32string_view text) -> std::vector<std::u32string> {
    std::vector<std::u32string> fragments;
    std::u32string current;
    for (auto c : text) {
        if (is_fragment_break(c)) {
            if (!current.empty()) {
                fragments.push_back(std::move(current));
                current.clear();
            }
            continue;
        }
        current.push_back(c);
    }
    if (!current.empty()) {
        fragments.push_back(std::move(current));
    }
    return fragments;
}

auto legible_text_color(Argb background, bool dark_theme) -> Argb {
    if (dark_theme) {
        return rgb(255, 255, 255);
    }
    return luminance(background) < 128.0 ? rgb(255, 255, 255) : rgb(55, 71, 79);
}

auto secondary_text_color(Argb text_color) -> Argb {
    return text_color == rgb(255, 255, 255) ? rgb(200, 200, 200) : rgb(128, 128, 128);
}

auto watermark_metrics(std::size_t char_count, double canvas_width, double canvas_height) -> WatermarkMetrics {
    constexpr double line_factor = 1.28;
    auto count = static_cast<double>(std::max<std::size_t>(1, char_count));
    auto safe_vertical = canvas_height > 0.0 ? std::max(26.0, canvas_height * 0.10) : 85.0;
    auto safe_right = canvas_width > 0.0 ? std::max(18.0, canvas_width * 0.03) : 60.0;
    auto available = std::max(1.0, (canvas_height > 0.0 ? canvas_height : 900.0) - safe_vertical * 2.0);

    WatermarkMetrics metrics;
    metrics.font_size = std::clamp((available / (count * line_factor)) * 0.88, 70.0, 240.0);
    metrics.line_height = metrics.font_size * line_factor;
    metrics.top = safe_vertical;
    metrics.nudge = metrics.font_size * 0.08;
    metrics.right_margin = std::round(safe_right + metrics.font_size * 0.25);
    return metrics;
}

auto CompositionSurface::effect_canvas_height(Effects::EffectKind kind, double logical_height) -> double {
    if (kind == Effects::EffectKind::Wave) {
        return std::min(kWaveBandHeight, logical_height);
    }
    return logical_height;
}

auto CompositionSurface::compose(SceneInputs const& inputs,
                                 std::span<Effects::EffectPath const> effect_paths,
                                 double logical_width,
                                 double logical_height) const -> DrawList {
    DrawList list;
    list.logical_width = static_cast<float>(logical_width);
    list.logical_height = static_cast<float>(logical_height);

    RectCommand background;
    background.max_x = list.logical_width;
    background.max_y = list.logical_height;
    background.color = to_float(inputs.background);
    list.commands.emplace_back(background);

    auto effect_top = logical_height - effect_canvas_height(inputs.effect, logical_height);
    for (auto const& effect_path : effect_paths) {
        PathCommand command;
        command.path = translated(effect_path.geometry, effect_top);
        command.fill_color = to_float(effect_path.fill);
        list.commands.emplace_back(std::move(command));
    }

    if (inputs.dark_theme) {
        RectCommand overlay = background;
        overlay.color = {0.0f, 0.0f, 0.0f, kDarkOverlayOpacity};
        list.commands.emplace_back(overlay);
    }

    auto text_color = legible_text_color(inputs.background, inputs.dark_theme);
    auto secondary = secondary_text_color(text_color);
    if (inputs.style.orientation == Orientation::Horizontal) {
        compose_horizontal(list, inputs, text_color, secondary, logical_width, logical_height);
    } else {
        compose_vertical(list, inputs, text_color, secondary, logical_width, logical_height);
    }

    compose_watermark(list, inputs, logical_width, logical_height);
    return list;
}

} // namespace VW::Scene
