#include "parser_registry.hpp"
#include <algorithm>
#include <cctype>

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

} // namespace

ParserRegistry::ParserRegistry() {
    for (const auto& descriptor : builtinLanguages()) {
        registerLanguage(descriptor);
    }
}

ParserRegistry::ParserRegistry(Empty) {}

ParserRegistry& ParserRegistry::instance() {
    static ParserRegistry registry;
    return registry;
}

void ParserRegistry::registerLanguage(LanguageDescriptor descriptor) {
    std::lock_guard<std::mutex> lock(mutex_);

    const std::string name = toLower(descriptor.name);
    for (const auto& alias : descriptor.aliases) {
        aliases_[toLower(alias)] = name;
    }
    for (const auto& extension : descriptor.extensions) {
        extensions_[toLower(extension)] = name;
    }

    // A new descriptor supersedes any parser built from an older one
    parsers_.erase(name);
    descriptors_[name] = std::move(descriptor);
}

void ParserRegistry::registerParser(std::shared_ptr<const LanguageParser> parser,
                                    const std::vector<std::string>& extensions) {
    if (!parser) {
        throw std::invalid_argument("Cannot register a null parser");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    const std::string name = toLower(parser->language());
    for (const auto& extension : extensions) {
        extensions_[toLower(extension)] = name;
    }
    parsers_[name] = std::move(parser);
}

ParserHandle ParserRegistry::getParser(const std::string& language) {
    std::lock_guard<std::mutex> lock(mutex_);

    const std::string name = canonicalName(language);

    auto cached = parsers_.find(name);
    if (cached != parsers_.end()) {
        return cached->second;
    }

    auto descriptor = descriptors_.find(name);
    if (descriptor == descriptors_.end()) {
        throw UnsupportedLanguageError(language);
    }

    // Query compilation happens once per language, under the lock
    ParserHandle parser = std::make_shared<TreeSitterParser>(descriptor->second);
    parsers_[name] = parser;
    return parser;
}

std::string ParserRegistry::detectLanguage(const fs::path& path) const {
    std::string extension = path.extension().string();
    if (extension.size() < 2) {
        return "";
    }
    extension = toLower(extension.substr(1));

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = extensions_.find(extension);
    return it == extensions_.end() ? "" : it->second;
}

bool ParserRegistry::supportsLanguage(const std::string& language) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string name = canonicalName(language);
    return descriptors_.count(name) > 0 || parsers_.count(name) > 0;
}

std::vector<std::string> ParserRegistry::languages() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> names;
    for (const auto& entry : descriptors_) {
        names.push_back(entry.first);
    }
    for (const auto& entry : parsers_) {
        if (!descriptors_.count(entry.first)) {
            names.push_back(entry.first);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::string ParserRegistry::canonicalName(const std::string& language) const {
    const std::string name = toLower(language);
    auto alias = aliases_.find(name);
    return alias == aliases_.end() ? name : alias->second;
}
