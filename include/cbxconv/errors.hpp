#pragma once
// fehler die über archiv-grenzen hinweg geworfen werden
// alles was pro bild passiert landet in ConversionResult, nicht hier

#include <stdexcept>
#include <string>

namespace cbxconv {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// extension / format tag unbekannt
class UnsupportedFormat : public Error {
public:
    explicit UnsupportedFormat(const std::string& what) : Error(what) {}
};

// entry würde aus dem ziel-ordner rausschreiben (zip-slip)
class UnsafeEntryPath : public Error {
public:
    explicit UnsafeEntryPath(const std::string& what) : Error(what) {}
};

// io fehler oder kaputtes archiv
class ExtractionFailure : public Error {
public:
    explicit ExtractionFailure(const std::string& what) : Error(what) {}
};

class ConversionFailure : public Error {
public:
    explicit ConversionFailure(const std::string& what) : Error(what) {}
};

class PackagingFailure : public Error {
public:
    explicit PackagingFailure(const std::string& what) : Error(what) {}
};

// kaputte config, fliegt bevor irgendwas angefasst wird
class ConfigurationError : public Error {
public:
    explicit ConfigurationError(const std::string& what) : Error(what) {}
};

} // namespace cbxconv
