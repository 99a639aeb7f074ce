// Copyright (c) 2012-2014 Konstantin Isakov <ikm@zbackup.org> and ZBackup contributors, see CONTRIBUTORS
// Part of ZBackup. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#ifndef COMPRESSION_HH_INCLUDED__
#define COMPRESSION_HH_INCLUDED__

#include <stddef.h>
#include <string>
#include <vector>

#include "sptr.hh"
#include "ex.hh"
#include "nocopy.hh"


/// Codecs archived WAL files may be stored with
namespace Compression {

DEF_EX( Ex, "Compression exception", std::exception )
DEF_EX_STR( exUnsupportedCompressionMethod, "Unsupported compression method:", Ex )
DEF_EX_STR( exCodecError, "Codec failure:", Ex )
DEF_EX_STR( exCorruptData, "Compressed data is corrupt:", Ex )


// used for encoding or decoding
class EnDecoder: NoCopy
{
protected:
  EnDecoder();
public:
  virtual ~EnDecoder();

  // encoder can read up to size bytes from data
  virtual void setInput ( const void* data, size_t size ) =0;
  // how many bytes of the last input haven't been used, yet?
  virtual size_t getAvailableInput() =0;

  // encoder can write up to size bytes to output
  virtual void setOutput( void* data, size_t size ) =0;
  // how many bytes of free space are remaining in the output buffer
  virtual size_t getAvailableOutput() =0;

  // process some bytes
  // finish: will you pass more data to the encoder via setOutput?
  // NOTE You must eventually set finish to true.
  // returns, whether all output bytes have been written
  // Throws exCorruptData if the input can't be decoded
  virtual bool process( bool finish ) =0;
};

// compression method
class CompressionMethod
{
public:
  virtual ~CompressionMethod();

  // returns name of compression method
  virtual std::string getName() const =0;

  // returns the suffix archived files compressed with this method carry,
  // including the dot
  virtual std::string getFileSuffix() const =0;

  virtual sptr<EnDecoder> createEncoder() const =0;
  virtual sptr<EnDecoder> createDecoder() const =0;

  // find a compression by name
  // If optional is false, it will either return a valid CompressionMethod
  // object or throw. If optional is true, it will return NULL, if it cannot
  // find a compression with that name.
  static const_sptr<CompressionMethod> findCompression(
    const std::string& name, bool optional = false );

  // find the compression the given file name is compressed with, judging by
  // its suffix. Returns NULL if there's none
  static const_sptr<CompressionMethod> findBySuffix(
    const std::string& fileName );

  // all the supported methods, in the order archives are searched with them
  static std::vector< const_sptr<CompressionMethod> > const & getAll();
};

// Runs the whole of the input file through the given encoder or decoder,
// writing the result to the output file
void processFile( EnDecoder &, std::string const & inputFileName,
                  std::string const & outputFileName );

}

#endif
