#include "stopwords.hpp"
#include "text_utils.hpp"

#include <fstream>
#include <stdexcept>

namespace summarizer {

static const StopwordSet& english_stopwords() {
    static const StopwordSet words = {
        "the", "a", "an", "is", "are", "was", "were", "be", "been", "being",
        "in", "on", "at", "of", "for", "to", "from", "with", "without", "by",
        "and", "or", "but", "if", "then", "so", "than", "as", "that", "this",
        "these", "those", "it", "its", "into", "about", "over", "after", "before",
        "under", "above", "you", "we", "they", "he", "she", "his", "her", "their",
        "our", "your", "not", "no", "do", "does", "did", "done", "can", "could",
        "should", "would", "will", "just", "also", "such", "i", "me", "my", "myself",
        "ours", "yours", "theirs", "what", "which", "who", "whom", "where", "when",
        "why", "how", "all", "any", "both", "each", "few", "more", "most", "other",
        "some", "own", "same",
        // contraction fragments: it's, don't, I'd, we'll, I'm, o'clock, we're, I've, y'all
        "s", "t", "d", "ll", "m", "o", "re", "ve", "y"
    };
    return words;
}

static const StopwordSet& arabic_stopwords() {
    static const StopwordSet words = {
        "و", "في", "على", "من", "إلى", "الى", "عن", "هذا", "هذه", "ذلك", "تلك",
        "هناك", "هنا", "هو", "هي", "هم", "هن", "أنا", "انا", "أنت", "انت", "أنتم",
        "انتم", "أنتن", "انتن", "نحن", "كما", "مثل", "لكن", "بل", "أو", "او", "أم",
        "ام", "مع", "أكثر", "اكثر", "أقل", "اقل", "قد", "لقد", "لم", "لن", "لا",
        "ما", "ماذا", "لماذا", "كيف", "أين", "اين", "متى", "إن", "ان", "أن", "أنّ",
        "كان", "تكون", "يكون", "كانت", "كانوا", "سوف", "كل", "أي", "اي",
        "بعض", "بين", "ضمن", "خلال", "قبل", "بعد", "عند", "عندما", "حيث", "إذ",
        "اذ", "إلا", "الا", "أيضًا", "ايضًا", "ايضا", "جدًا", "جدا"
    };
    return words;
}

const StopwordSet& default_stopwords(Language language) {
    switch (language) {
        case Language::ARABIC: return arabic_stopwords();
        case Language::ENGLISH: return english_stopwords();
    }
    return english_stopwords();
}

StopwordSet load_stopwords(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open stopword file: " + path);
    }

    StopwordSet words;
    std::string line;
    while (std::getline(file, line)) {
        std::string word = trim(line);
        if (word.empty() || word[0] == '#') continue;
        words.insert(to_lower(word));
    }

    return words;
}

}
