//
// Class Inform
//   Takes messages and displays them to the given ostream.
//
#include "Qsw.h"

#include "Utility/Inform.h"

// range of Inform message levels
constexpr int MIN_INFORM_LEVEL = 1;
constexpr int MAX_INFORM_LEVEL = 5;

/////////////////////////////////////////////////////////////////////
// manipulator functions

// signal we wish to send the message
Inform& endl(Inform& inf) {
    inf << '\n';
    return inf.outputMessage();
}

// set the current msg level
Inform& level1(Inform& inf) {
    return inf.setMessageLevel(1);
}
Inform& level2(Inform& inf) {
    return inf.setMessageLevel(2);
}
Inform& level3(Inform& inf) {
    return inf.setMessageLevel(3);
}
Inform& level4(Inform& inf) {
    return inf.setMessageLevel(4);
}
Inform& level5(Inform& inf) {
    return inf.setMessageLevel(5);
}

namespace {
    int currentRank() {
        return qsw::Comm ? qsw::Comm->rank() : 0;
    }

    int currentSize() {
        return qsw::Comm ? qsw::Comm->size() : 1;
    }
}  // namespace

void Inform::setup(const char* myname, int pnode) {
    on_m = true;

    if (qsw::Info) {
        outputLevel_m = qsw::Info->getOutputLevel();
    } else {
        outputLevel_m = MIN_INFORM_LEVEL;
    }
    msgLevel_m  = MIN_INFORM_LEVEL;
    printNode_m = pnode;

    hasName_m = (myname != nullptr);
    if (hasName_m) {
        name_m = myname;
    }
}

Inform::Inform(const char* myname, int pnode)
    : formatBuf_m(std::ios::out)
    , msgDest_mp(&std::cout) {
    setup(myname, pnode);
}

Inform::Inform(const char* myname, std::ostream& os, int pnode)
    : formatBuf_m(std::ios::out)
    , msgDest_mp(&os) {
    setup(myname, pnode);
}

Inform::Inform(const char* myname, const Inform& os, int pnode)
    : formatBuf_m(std::ios::out)
    , msgDest_mp(os.msgDest_mp) {
    setup(myname, pnode);
}

void Inform::displaySingleLine(const std::string& line) {
    // if no name was given, do not print any prefix at all
    if (hasName_m) {
        *msgDest_mp << name_m;

        if (currentSize() > 1) {
            *msgDest_mp << "{" << currentRank() << "}";
        }

        if (msgLevel_m > 1) {
            *msgDest_mp << "[" << msgLevel_m << "]";
        }

        *msgDest_mp << "> ";
    }

    *msgDest_mp << line << std::endl;
}

void Inform::displayMessage(const std::string& msg) {
    if (on_m && msgLevel_m <= outputLevel_m) {
        std::string::size_type begin = 0;
        do {
            std::string::size_type end = msg.find('\n', begin);
            if (end == std::string::npos) {
                end = msg.size();
            }
            displaySingleLine(msg.substr(begin, end - begin));
            begin = end + 1;
        } while (begin <= msg.size());
    }
    msgLevel_m = MIN_INFORM_LEVEL;
}

Inform& Inform::setOutputLevel(const int ol) {
    if (ol >= (MIN_INFORM_LEVEL - 1) && ol <= MAX_INFORM_LEVEL) {
        outputLevel_m = ol;
    }
    return *this;
}

Inform& Inform::setMessageLevel(const int ol) {
    if (ol >= MIN_INFORM_LEVEL && ol <= MAX_INFORM_LEVEL) {
        msgLevel_m = ol;
    }
    return *this;
}

Inform& Inform::outputMessage() {
    if (printNode_m < 0 || printNode_m == currentRank()) {
        std::string msg = formatBuf_m.str();
        // the trailing newline added by 'endl' terminates the last line
        if (!msg.empty() && msg.back() == '\n') {
            msg.pop_back();
        }
        displayMessage(msg);
    } else {
        msgLevel_m = MIN_INFORM_LEVEL;
    }

    formatBuf_m.str(std::string());
    formatBuf_m.clear();
    return *this;
}
