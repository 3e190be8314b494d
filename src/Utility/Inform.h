//
// Class Inform
//   Takes messages and displays them to the given ostream.
//
//   A message is sent to an Inform object by treating it as an ostream,
//   then ending the message by sending the 'endl' manipulator.
//
//   Each message is assigned the current 'level of interest'; the lower
//   the level, the more important it is. Each Inform object is also
//   set for a current level; messages with a level <= the current level
//   are displayed. Levels run from 1 ... 5. Thus, setting the level of an
//   Inform object to 0 will turn off printing of all messages.
//
//   By default, a new Inform object will only print out the message on
//   rank 0. The print node may be changed with 'setPrintNode(int)'; if the
//   argument is 'INFORM_ALL_NODES', the message is printed on all ranks.
//
#ifndef QSW_INFORM_H
#define QSW_INFORM_H

#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

#define INFORM_ALL_NODES (-1)

class Inform {
public:
    // constructor: arguments = name, print node
    Inform(const char* myname = nullptr, int pnode = 0);

    // prefix and an ostream object to write to, as well as the print node
    Inform(const char* myname, std::ostream& os, int pnode = 0);

    // prefix and an Inform instance from which the ostream object is copied
    Inform(const char* myname, const Inform& os, int pnode = 0);

    ~Inform() = default;

    // turn messages on/off
    void on(const bool o) { on_m = o; }
    bool isOn() const { return on_m; }

    // change output destination
    void setDestination(std::ostream& dest) { msgDest_mp = &dest; }
    std::ostream& getDestination() { return *msgDest_mp; }

    // get/set the current output level
    Inform& setOutputLevel(const int);
    int getOutputLevel() const { return outputLevel_m; }

    // get/set the current message level
    Inform& setMessageLevel(const int);
    int getMessageLevel() const { return msgLevel_m; }

    // get/set the printing node. If set to a value < 0, all nodes print.
    int getPrintNode() const { return printNode_m; }
    void setPrintNode(int n = INFORM_ALL_NODES) { printNode_m = n; }

    // return a reference to the internal ostream used to format messages
    std::ostream& getStream() { return formatBuf_m; }

    // the signal has been given, print out the message. Return ref to object.
    Inform& outputMessage();

    // functions used to change format state; used just as for iostreams
    typedef std::ios_base::fmtflags FmtFlags_t;

    FmtFlags_t setf(FmtFlags_t setbits, FmtFlags_t field) {
        return formatBuf_m.setf(setbits, field);
    }
    FmtFlags_t setf(FmtFlags_t f) { return formatBuf_m.setf(f); }
    void unsetf(FmtFlags_t f) { formatBuf_m.unsetf(f); }
    FmtFlags_t flags() const { return formatBuf_m.flags(); }
    int precision() const { return formatBuf_m.precision(); }
    int precision(int p) { return formatBuf_m.precision(p); }
    void flush() { msgDest_mp->flush(); }

private:
    // name of this object; put at the start of each message
    std::string name_m;
    bool hasName_m;

    // an ostringstream used to format the messages
    std::ostringstream formatBuf_m;

    // where to put the messages; by default = cout
    std::ostream* msgDest_mp;

    bool on_m;

    // limit printing only to this node (if < 0, all nodes print)
    int printNode_m;

    // messages with a level <= the output level are printed
    int outputLevel_m;

    // set by the 'levelN' manipulators, reset to the minimum after printing
    int msgLevel_m;

    // print out the message line by line, each with the prefix
    void displayMessage(const std::string& msg);

    void displaySingleLine(const std::string& line);

    void setup(const char* myname, int pnode);
};

// manipulator for signaling we want to send the message.
extern Inform& endl(Inform&);

// manipulators for setting the current msg level
extern Inform& level1(Inform&);
extern Inform& level2(Inform&);
extern Inform& level3(Inform&);
extern Inform& level4(Inform&);
extern Inform& level5(Inform&);

// templated version of operator<< for Inform objects
template <class T>
inline Inform& operator<<(Inform& o, const T& val) {
    o.getStream() << val;
    return o;
}

// specialized version of operator<< to handle Inform-specific manipulators
inline Inform& operator<<(Inform& o, Inform& (*d)(Inform&)) {
    return d(o);
}

// specialized function for sending strings to Inform object
inline Inform& operator<<(Inform& out, const std::string& s) {
    out.getStream() << s;
    return out;
}

#endif
