// vi:noai:sw=4
// Copyright © 2013 David Bryant
// Copyright © 2026 ecma48 contributors

#ifndef SUPPORT__CMDLINE__HXX
#define SUPPORT__CMDLINE__HXX

#include "ecma48/support/debug.hxx"
#include "ecma48/support/conv.hxx"
#include "ecma48/support/exception.hxx"

#include <cstdlib>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

// Parses "--opt", "--opt=value", "--opt value", "--no-opt" and "-o".
// Everything else, and everything after the delimiter, is returned from
// parse() as a positional argument.
class CmdLine {
public:
    class Handler {
    public:
        virtual bool isNegatable() const = 0;
        virtual bool wantsValue() const = 0;
        virtual void handle(bool negated, const std::string & value) = 0;

        virtual ~Handler() {}
    };

private:
    struct Option {
        Option(std::unique_ptr<Handler> handler_,
               char                     shortOpt_,
               const std::string      & longOpt_,
               bool                     mandatory_) :
            handler(std::move(handler_)),
            shortOpt(shortOpt_),
            longOpt(longOpt_),
            mandatory(mandatory_)
        {}

        std::unique_ptr<Handler> handler;
        char                     shortOpt;
        std::string              longOpt;
        bool                     mandatory;
        bool                     serviced = false;
    };

    std::string                      _help;
    std::string                      _version;
    std::string                      _delimiter;

    std::vector<Option>              _options;

    std::map<char,        size_t>    _shortToOption;
    std::map<std::string, size_t>    _longToOption;

public:
    CmdLine(const std::string & help,
            const std::string & version,
            const std::string & delimiter = "--") :
        _help(help),
        _version(version),
        _delimiter(delimiter) {}

    void add(std::unique_ptr<Handler> handler,
             char shortOpt,
             const std::string & longOpt,
             bool mandatory = false) {
        ENFORCE(!longOpt.empty() || shortOpt != '\0', );

        auto index = _options.size();

        if (!longOpt.empty()) {
            ENFORCE(_longToOption.find(longOpt) == _longToOption.end(), << longOpt);
            _longToOption.insert(std::make_pair(longOpt, index));
        }

        if (shortOpt != '\0') {
            ENFORCE(_shortToOption.find(shortOpt) == _shortToOption.end(), << shortOpt);
            _shortToOption.insert(std::make_pair(shortOpt, index));
        }

        _options.emplace_back(std::move(handler), shortOpt, longOpt, mandatory);
    }

    std::vector<std::string> parse(int argc, const char ** argv) {
        std::vector<std::string> arguments;
        bool ignore = false;

        ASSERT(argc >= 1, );
        for (int i = 1; i != argc; ++i) {
            std::string str = argv[i];

            if (ignore || str.empty() || str.front() != '-' || str == "-") {
                arguments.push_back(str);
                continue;
            }

            if (str == _delimiter) {
                ignore = true;
                continue;
            }

            if (str == "--help") {
                std::cout << _help;
                std::exit(0);
            }

            if (str == "--version") {
                std::cout << "ecma48 version " << _version << std::endl;
                std::exit(0);
            }

            if (str.substr(0, 2) == "--") {
                // Long option.
                size_t j = 2;
                bool negated = false;

                if (str.substr(j, 3) == "no-" &&
                    _longToOption.find(str.substr(j)) == _longToOption.end()) {
                    negated = true;
                    j += 3;
                }

                auto e = str.find('=', j);
                auto & option = lookupLong(str.substr(j, e == std::string::npos ?
                                                          std::string::npos : e - j));

                THROW_UNLESS(!negated || option.handler->isNegatable(),
                             UserError("Option cannot be negated: " + str));

                std::string value;

                if (option.handler->wantsValue()) {
                    if (e != std::string::npos) {
                        value = str.substr(e + 1);
                    }
                    else {
                        ++i;
                        THROW_UNLESS(i != argc, UserError("No value provided for: " + str));
                        value = argv[i];
                    }
                }
                else {
                    THROW_UNLESS(e == std::string::npos,
                                 UserError("No value required for: " + str));
                }

                option.handler->handle(negated, value);
                option.serviced = true;
            }
            else {
                // Short option(s), the last of which may take a value.
                for (size_t j = 1; j != str.size(); ++j) {
                    auto & option = lookupShort(str[j]);
                    std::string value;

                    if (option.handler->wantsValue()) {
                        if (j + 1 != str.size()) {
                            value = str.substr(j + 1);
                        }
                        else {
                            ++i;
                            THROW_UNLESS(i != argc, UserError("No value provided for: " + str));
                            value = argv[i];
                        }
                        j = str.size() - 1;
                    }

                    option.handler->handle(false, value);
                    option.serviced = true;
                }
            }
        }

        for (auto & o : _options) {
            THROW_UNLESS(!o.mandatory || o.serviced,
                         UserError("Missing mandatory option: --" + o.longOpt));
        }

        return arguments;
    }

protected:
    Option & lookupShort(char s) {
        auto iter = _shortToOption.find(s);

        if (iter == _shortToOption.end()) {
            std::string str; str.push_back(s);
            THROW(UserError("Unknown option: -" + str));
        }

        return _options[iter->second];
    }

    Option & lookupLong(const std::string & l) {
        auto iter = _longToOption.find(l);

        if (iter == _longToOption.end()) {
            THROW(UserError("Unknown option: --" + l));
        }

        return _options[iter->second];
    }
};

//
//
//

class BoolHandler final : public CmdLine::Handler {
    bool & _value;
public:
    explicit BoolHandler(bool & value) : _value(value) {}

    bool isNegatable() const override { return true; }
    bool wantsValue()  const override { return false; }

    void handle(bool negated, const std::string & UNUSED(value)) override {
        _value = !negated;
    }
};

template <class V>
class IStreamHandler final : public CmdLine::Handler {
    V & _value;
public:
    explicit IStreamHandler(V & value) : _value(value) {}

    bool isNegatable() const override { return false; }
    bool wantsValue()  const override { return true; }

    void handle(bool UNUSED(negated), const std::string & value) override {
        _value = unstringify<V>(value);
    }
};

using StringHandler = IStreamHandler<std::string>;

class MiscHandler final : public CmdLine::Handler {
    using Function = std::function<void (const std::string &)>;
    Function _func;
public:
    explicit MiscHandler(const Function & func) : _func(func) {}

    bool isNegatable() const override { return false; }
    bool wantsValue()  const override { return true; }

    void handle(bool UNUSED(negated), const std::string & value) override {
        _func(value);
    }
};

#endif // SUPPORT__CMDLINE__HXX
