#include "ParameterSet.hpp"

#include "TextDecoding.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

namespace ws {

namespace {

whisper_sampling_strategy to_native(SamplingStrategy strategy) {
    switch (strategy) {
        case SamplingStrategy::greedy:      return WHISPER_SAMPLING_GREEDY;
        case SamplingStrategy::beam_search: return WHISPER_SAMPLING_BEAM_SEARCH;
    }
    return WHISPER_SAMPLING_GREEDY;
}

} // namespace

// ---------------------------------------------------------------------------
// Construction / copy
// ---------------------------------------------------------------------------

ParameterSet::ParameterSet(SamplingStrategy strategy)
    : params_(whisper_full_default_params(to_native(strategy))) {
    params_.print_progress = false;
    params_.n_threads      = default_thread_count();
    params_.max_len        = kDefaultMaxSegmentLength;
    set_language("auto");
}

ParameterSet::ParameterSet(const ParameterSet& other)
    : params_(other.params_) {
    copy_owned_strings(other);
}

ParameterSet& ParameterSet::operator=(const ParameterSet& other) {
    if (this != &other) {
        // Our old buffers stay alive until copy_owned_strings() replaces them.
        params_ = other.params_;
        copy_owned_strings(other);
    }
    return *this;
}

void ParameterSet::copy_owned_strings(const ParameterSet& other) {
    if (other.language_.installed_in(other.params_.language)) {
        language_.assign(params_.language, other.params_.language);
    } else {
        language_.reset();
    }

    if (other.initial_prompt_.installed_in(other.params_.initial_prompt)) {
        initial_prompt_.assign(params_.initial_prompt, other.params_.initial_prompt);
    } else {
        initial_prompt_.reset();
    }

    // Rebuilt from scratch; our previous buffers are freed when the old
    // vector goes, after every slot already points at the copy.
    std::vector<OwnedField> copied;
    for (const OwnedField& entry : other.other_strings_) {
        if (!entry.second->installed_in(other.params_.*entry.first)) {
            continue;
        }
        auto owned = std::make_unique<OwnedCString<>>();
        owned->assign(params_.*entry.first, other.params_.*entry.first);
        copied.emplace_back(entry.first, std::move(owned));
    }
    other_strings_.swap(copied);
}

OwnedCString<>& ParameterSet::owner_of(StringField field) {
    for (OwnedField& entry : other_strings_) {
        if (entry.first == field) {
            return *entry.second;
        }
    }
    other_strings_.emplace_back(field, std::make_unique<OwnedCString<>>());
    return *other_strings_.back().second;
}

// ---------------------------------------------------------------------------
// generic string fields
// ---------------------------------------------------------------------------

std::string ParameterSet::string_field(StringField field) const {
    const char* raw = params_.*field;
    if (!raw) {
        return "";
    }
    return decode_native_text_or_throw(raw, "string field");
}

void ParameterSet::set_string_field(StringField field, const std::string& value) {
    if (field == &whisper_full_params::language) {
        set_language(value);
    } else if (field == &whisper_full_params::initial_prompt) {
        set_initial_prompt(value);
    } else {
        owner_of(field).assign(params_.*field, value);
    }
}

// ---------------------------------------------------------------------------
// language
// ---------------------------------------------------------------------------

std::string ParameterSet::language() const {
    return decode_native_text_or_throw(params_.language, "language");
}

void ParameterSet::set_language(const std::string& code) {
    if (code != "auto" && whisper_lang_id(code.c_str()) < 0) {
        throw std::invalid_argument("unknown language code: '" + code + "'");
    }
    language_.assign(params_.language, code);
}

// ---------------------------------------------------------------------------
// initial_prompt
// ---------------------------------------------------------------------------

std::string ParameterSet::initial_prompt() const {
    if (!params_.initial_prompt) {
        return "";
    }
    return decode_native_text_or_throw(params_.initial_prompt, "initial_prompt");
}

void ParameterSet::set_initial_prompt(const std::string& text) {
    initial_prompt_.assign(params_.initial_prompt, text);
}

// ---------------------------------------------------------------------------
// strategy / defaults
// ---------------------------------------------------------------------------

SamplingStrategy ParameterSet::strategy() const {
    return params_.strategy == WHISPER_SAMPLING_BEAM_SEARCH
        ? SamplingStrategy::beam_search
        : SamplingStrategy::greedy;
}

int ParameterSet::default_thread_count() {
    const int hw = static_cast<int>(std::thread::hardware_concurrency());
    return std::max(1, std::min(8, hw - 2));
}

std::vector<std::string> ParameterSet::available_languages() {
    std::vector<std::string> codes;
    codes.emplace_back("auto");
    for (int id = 0; id <= whisper_lang_max_id(); ++id) {
        if (const char* code = whisper_lang_str(id)) {
            codes.emplace_back(code);
        }
    }
    return codes;
}

} // namespace ws
