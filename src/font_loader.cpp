#include "font_loader.hpp"
#include "etch/log.hpp"

#include <fontconfig/fontconfig.h>

#define STB_TRUETYPE_IMPLEMENTATION
#include <stb_truetype.h>

#include <cstdio>
#include <mutex>
#include <vector>

namespace etch {

namespace {

// Decode one UTF-8 code point starting at text[i]; advances i.
// Malformed bytes decode as U+FFFD.
u32 nextCodepoint(std::string_view text, size_t& i) {
    u8 c = static_cast<u8>(text[i++]);
    if (c < 0x80) return c;

    int extra = 0;
    u32 cp = 0;
    if ((c & 0xE0) == 0xC0) { extra = 1; cp = c & 0x1F; }
    else if ((c & 0xF0) == 0xE0) { extra = 2; cp = c & 0x0F; }
    else if ((c & 0xF8) == 0xF0) { extra = 3; cp = c & 0x07; }
    else return 0xFFFD;

    for (int k = 0; k < extra; ++k) {
        if (i >= text.size() || (static_cast<u8>(text[i]) & 0xC0) != 0x80) return 0xFFFD;
        cp = (cp << 6) | (static_cast<u8>(text[i++]) & 0x3F);
    }
    return cp;
}

bool readFile(const char* path, std::vector<u8>& out) {
    std::FILE* f = std::fopen(path, "rb");
    if (!f) return false;
    std::fseek(f, 0, SEEK_END);
    long size = std::ftell(f);
    std::fseek(f, 0, SEEK_SET);
    if (size <= 0) {
        std::fclose(f);
        return false;
    }
    out.resize(static_cast<size_t>(size));
    size_t got = std::fread(out.data(), 1, out.size(), f);
    std::fclose(f);
    return got == out.size();
}

FcConfig* fontConfig() {
    static std::once_flag once;
    static FcConfig* config = nullptr;
    std::call_once(once, [] { config = FcInitLoadConfigAndFonts(); });
    return config;
}

// Ask fontconfig for the best file for a family and style.
bool matchFontFile(const std::string& family, FontStyle style, std::string& path, int& index) {
    FcConfig* config = fontConfig();
    if (!config) return false;

    bool bold = (static_cast<u8>(style) & static_cast<u8>(FontStyle::Bold)) != 0;
    bool italic = (static_cast<u8>(style) & static_cast<u8>(FontStyle::Italic)) != 0;

    FcPattern* pattern = FcPatternCreate();
    FcPatternAddString(pattern, FC_FAMILY, reinterpret_cast<const FcChar8*>(family.c_str()));
    FcPatternAddInteger(pattern, FC_WEIGHT, bold ? FC_WEIGHT_BOLD : FC_WEIGHT_REGULAR);
    FcPatternAddInteger(pattern, FC_SLANT, italic ? FC_SLANT_ITALIC : FC_SLANT_ROMAN);
    FcConfigSubstitute(config, pattern, FcMatchPattern);
    FcDefaultSubstitute(pattern);

    FcResult result = FcResultNoMatch;
    FcPattern* match = FcFontMatch(config, pattern, &result);
    FcPatternDestroy(pattern);
    if (!match) return false;

    bool found = false;
    FcChar8* file = nullptr;
    if (FcPatternGetString(match, FC_FILE, 0, &file) == FcResultMatch && file) {
        path = reinterpret_cast<const char*>(file);
        if (FcPatternGetInteger(match, FC_INDEX, 0, &index) != FcResultMatch) {
            index = 0;
        }
        found = true;
    }
    FcPatternDestroy(match);
    return found;
}

class TrueTypeTypeface : public Typeface {
public:
    TrueTypeTypeface(std::string family, FontStyle style)
        : Typeface(std::move(family), style) {}

    bool load(const std::string& path, int index) {
        if (!readFile(path.c_str(), fontData_)) {
            return false;
        }
        int offset = stbtt_GetFontOffsetForIndex(fontData_.data(), index);
        if (offset < 0 || !stbtt_InitFont(&info_, fontData_.data(), offset)) {
            fontData_.clear();
            return false;
        }
        stbtt_GetFontVMetrics(&info_, &ascent_, &descent_, &lineGap_);
        loaded_ = true;
        return true;
    }

    FontMetricsData metrics(f32 size) const override {
        FontMetricsData m;
        if (!loaded_) return m;
        f32 scale = stbtt_ScaleForMappingEmToPixels(&info_, size);
        m.ascent = -ascent_ * scale;
        m.descent = -descent_ * scale;
        m.leading = lineGap_ * scale;
        return m;
    }

    f32 measureText(std::string_view text, f32 size) const override {
        if (!loaded_) return 0;
        f32 scale = stbtt_ScaleForMappingEmToPixels(&info_, size);
        i32 units = 0;
        u32 prev = 0;
        size_t i = 0;
        while (i < text.size()) {
            u32 cp = nextCodepoint(text, i);
            int advance = 0, bearing = 0;
            stbtt_GetCodepointHMetrics(&info_, static_cast<int>(cp), &advance, &bearing);
            if (prev) {
                units += stbtt_GetCodepointKernAdvance(&info_, static_cast<int>(prev),
                                                       static_cast<int>(cp));
            }
            units += advance;
            prev = cp;
        }
        return units * scale;
    }

private:
    std::vector<u8> fontData_;
    stbtt_fontinfo info_{};
    int ascent_ = 0, descent_ = 0, lineGap_ = 0;
    bool loaded_ = false;
};

}

std::shared_ptr<const Typeface> loadSystemTypeface(const std::string& family, FontStyle style) {
    auto face = std::make_shared<TrueTypeTypeface>(family, style);

    std::string path;
    int index = 0;
    if (!matchFontFile(family, style, path, index)) {
        logWarning("font: no file found for family '%s' style %d", family.c_str(),
                   static_cast<int>(style));
        return face;
    }
    if (!face->load(path, index)) {
        logWarning("font: failed to load '%s' for family '%s'", path.c_str(), family.c_str());
        return face;
    }
    logInfo("font: '%s' style %d -> %s", family.c_str(), static_cast<int>(style), path.c_str());
    return face;
}

}
