//
// Class QswException
//   Exception thrown when a configuration or a numerical assumption of the
//   slice solver is violated. Carries the throwing method and a description.
//
#ifndef QSW_EXCEPTION_H
#define QSW_EXCEPTION_H

#include <string>

class QswException {
public:
    QswException(const std::string& meth, const std::string& descr)
        : descr_m(descr)
        , meth_m(meth) {}

    virtual ~QswException() = default;

    virtual const char* what() const throw() { return descr_m.c_str(); }

    virtual const std::string& where() const { return meth_m; }

private:
    std::string descr_m;
    std::string meth_m;
};

#endif
