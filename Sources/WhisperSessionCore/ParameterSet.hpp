#pragma once

#include "OwnedCString.hpp"
#include "Types.hpp"

#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "whisper.h"

namespace ws {

/// Owning wrapper around `whisper_full_params`.
///
/// Every native field is reachable through get()/set(), keyed by member
/// pointer:
///
///     ws::ParameterSet p(ws::SamplingStrategy::beam_search);
///     p.set(&whisper_full_params::translate, true);
///     p.set(&whisper_full_params::temperature, 0.2f);
///     int threads = p.get(&whisper_full_params::n_threads);
///
/// String fields are the exception: the struct only stores a pointer, so
/// they go through string_field()/set_string_field(), which own the backing
/// buffer for as long as it is installed:
///
///     p.set_string_field(&whisper_full_params::suppress_regex, "^\\[.*\\]$");
class ParameterSet {
public:
    /// Sampling strategy can only be chosen here.
    explicit ParameterSet(SamplingStrategy strategy = SamplingStrategy::greedy);
    ~ParameterSet() = default;

    /// Copies duplicate owned strings; a copy never aliases the source.
    ParameterSet(const ParameterSet& other);
    ParameterSet& operator=(const ParameterSet& other);

    // ---- Generic field access ----

    template <typename T>
    T get(T whisper_full_params::*field) const {
        return params_.*field;
    }

    template <typename T>
    void set(T whisper_full_params::*field, typename std::common_type<T>::type value) {
        static_assert(!std::is_same<T, const char*>::value,
                      "string fields are owned; use set_string_field()");
        params_.*field = value;
    }

    // ---- Owned string fields ----

    using StringField = const char* whisper_full_params::*;

    /// Empty when the field is null.  Throws DecodeError if it is not UTF-8.
    std::string string_field(StringField field) const;

    /// Copy `value` into a buffer owned by this set and point `field` at it.
    /// `language` is validated as in set_language().
    void set_string_field(StringField field, const std::string& value);

    /// Throws DecodeError if the native field is null or not UTF-8.
    std::string language() const;

    /// "auto" or any code whisper.cpp knows ("en", "de", ...).
    /// Throws std::invalid_argument for unknown codes.
    void set_language(const std::string& code);

    /// Empty when no prompt is set.
    std::string initial_prompt() const;
    void set_initial_prompt(const std::string& text);

    // ---- Strategy-specific knobs (nested in the native struct) ----

    SamplingStrategy strategy() const;

    int best_of() const { return params_.greedy.best_of; }
    void set_best_of(int n) { params_.greedy.best_of = n; }

    int beam_size() const { return params_.beam_search.beam_size; }
    void set_beam_size(int n) { params_.beam_search.beam_size = n; }

    /// The struct handed to the engine.  Valid while this object is alive
    /// and unchanged.
    const whisper_full_params& native() const { return params_; }

    /// clamp(hardware threads - 2, 1, 8)
    static int default_thread_count();

    static constexpr int kDefaultMaxSegmentLength = 5;

    /// Every language code the engine accepts, plus "auto".
    static std::vector<std::string> available_languages();

private:
    using OwnedField = std::pair<StringField, std::unique_ptr<OwnedCString<>>>;

    void copy_owned_strings(const ParameterSet& other);
    OwnedCString<>& owner_of(StringField field);

    whisper_full_params params_;
    OwnedCString<>      language_;
    OwnedCString<>      initial_prompt_;
    std::vector<OwnedField> other_strings_;
};

} // namespace ws
