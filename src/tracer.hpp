#ifndef _tracer_hpp_INCLUDED
#define _tracer_hpp_INCLUDED

namespace Refuter {

// The public 'Tracer' interface is declared in 'refuter.hpp'.  Following
// tracers are for internal use only and own the file they write to.

class FileTracer : public Tracer {
public:
  FileTracer () { }
  virtual ~FileTracer () { }
  virtual bool closed () = 0;
  virtual void close () = 0;
  virtual void flush () = 0;
  virtual void print_statistics () { }
};

}

#endif
