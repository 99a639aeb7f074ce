// Copyright (c) 2012-2014 Konstantin Isakov <ikm@zbackup.org> and ZBackup contributors, see CONTRIBUTORS
// Part of ZBackup. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#include <lzma.h>
#include <string>
#include <zlib.h>

#include "compression.hh"
#include "file.hh"
#include "utils.hh"

namespace Compression {

EnDecoder::EnDecoder() { }
EnDecoder::~EnDecoder() { }

CompressionMethod::~CompressionMethod() { }


// LZMA (.xz files)

class LZMAEnDecoder : public EnDecoder
{
protected:
  static lzma_stream initValue;
  lzma_stream strm;
public:
  LZMAEnDecoder()
  {
    strm = initValue;
  }

  void setInput( const void* data, size_t size )
  {
    strm.next_in  = (const uint8_t *) data;
    strm.avail_in = size;
  }

  void setOutput( void* data, size_t size )
  {
    strm.next_out  = (uint8_t *) data;
    strm.avail_out = size;
  }

  size_t getAvailableInput()
  {
    return strm.avail_in;
  }

  size_t getAvailableOutput()
  {
    return strm.avail_out;
  }

  bool process( bool finish )
  {
    lzma_ret ret = lzma_code( &strm, ( finish ? LZMA_FINISH : LZMA_RUN ) );

    switch ( ret )
    {
      case LZMA_OK:
        return false;
      case LZMA_STREAM_END:
        return true;
      case LZMA_FORMAT_ERROR:
      case LZMA_OPTIONS_ERROR:
      case LZMA_DATA_ERROR:
        throw exCorruptData( "lzma_code error " + Utils::numberToString( (int) ret ) );
      case LZMA_BUF_ERROR:
        // No progress possible: the stream ended before it should have
        throw exCorruptData( "truncated xz stream" );
      default:
        throw exCodecError( "lzma_code error " + Utils::numberToString( (int) ret ) );
    }
  }

  ~LZMAEnDecoder()
  {
    lzma_end( &strm );
  }
};
lzma_stream LZMAEnDecoder::initValue = LZMA_STREAM_INIT;

class LZMAEncoder : public LZMAEnDecoder
{
public:
  LZMAEncoder()
  {
    uint32_t preset = 6;
    lzma_ret ret = lzma_easy_encoder( &strm, preset, LZMA_CHECK_CRC64 );
    if ( ret != LZMA_OK )
      throw exCodecError( "lzma_easy_encoder error " + Utils::numberToString( (int) ret ) );
  }
};

class LZMADecoder : public LZMAEnDecoder
{
public:
  LZMADecoder()
  {
    lzma_ret ret = lzma_stream_decoder( &strm, UINT64_MAX, 0 );
    if ( ret != LZMA_OK )
      throw exCodecError( "lzma_stream_decoder error " + Utils::numberToString( (int) ret ) );
  }
};

class LZMACompression : public CompressionMethod
{
public:
  sptr<EnDecoder> createEncoder() const
  {
    return new LZMAEncoder();
  }

  sptr<EnDecoder> createDecoder() const
  {
    return new LZMADecoder();
  }

  std::string getName() const { return "xz"; }

  std::string getFileSuffix() const { return ".xz"; }
};


// gzip (.gz files), barman's default

class GzipEnDecoder : public EnDecoder
{
protected:
  z_stream strm;
  bool encoding;
public:
  GzipEnDecoder( bool encoding ): encoding( encoding )
  {
    strm.zalloc = Z_NULL;
    strm.zfree = Z_NULL;
    strm.opaque = Z_NULL;
    strm.next_in = Z_NULL;
    strm.avail_in = 0;

    // 16 added to the window bits selects the gzip wrapper instead of zlib's
    int ret = encoding ?
      deflateInit2( &strm, 6, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY ) :
      inflateInit2( &strm, 15 + 16 );

    if ( ret != Z_OK )
      throw exCodecError( "zlib init error " + Utils::numberToString( ret ) );
  }

  void setInput( const void* data, size_t size )
  {
    strm.next_in  = (Bytef *) data;
    strm.avail_in = size;
  }

  void setOutput( void* data, size_t size )
  {
    strm.next_out  = (Bytef *) data;
    strm.avail_out = size;
  }

  size_t getAvailableInput()
  {
    return strm.avail_in;
  }

  size_t getAvailableOutput()
  {
    return strm.avail_out;
  }

  bool process( bool finish )
  {
    uInt availOutBefore = strm.avail_out;

    int ret = encoding ? deflate( &strm, finish ? Z_FINISH : Z_NO_FLUSH ) :
                         inflate( &strm, finish ? Z_FINISH : Z_NO_FLUSH );

    switch ( ret )
    {
      case Z_OK:
        return false;
      case Z_STREAM_END:
        return true;
      case Z_BUF_ERROR:
        // Not fatal, unless we are told there's no more input and the
        // output buffer still had room
        if ( finish && !strm.avail_in && strm.avail_out == availOutBefore &&
             strm.avail_out )
          throw exCorruptData( "truncated gzip stream" );
        return false;
      case Z_DATA_ERROR:
      case Z_NEED_DICT:
        throw exCorruptData( strm.msg ? strm.msg : "gzip data error" );
      default:
        throw exCodecError( "zlib error " + Utils::numberToString( ret ) );
    }
  }

  ~GzipEnDecoder()
  {
    if ( encoding )
      deflateEnd( &strm );
    else
      inflateEnd( &strm );
  }
};

class GzipCompression : public CompressionMethod
{
public:
  sptr<EnDecoder> createEncoder() const
  {
    return new GzipEnDecoder( true );
  }

  sptr<EnDecoder> createDecoder() const
  {
    return new GzipEnDecoder( false );
  }

  std::string getName() const { return "gzip"; }

  std::string getFileSuffix() const { return ".gz"; }
};


// register them

std::vector< const_sptr<CompressionMethod> > const & CompressionMethod::getAll()
{
  static std::vector< const_sptr<CompressionMethod> > compressions;

  if ( compressions.empty() )
  {
    compressions.push_back( new GzipCompression() );
    compressions.push_back( new LZMACompression() );
  }

  return compressions;
}

const_sptr<CompressionMethod> CompressionMethod::findCompression( const std::string& name, bool optional )
{
  std::vector< const_sptr<CompressionMethod> > const & all = getAll();

  for ( size_t x = 0; x < all.size(); ++x )
  {
    if ( all[ x ]->getName() == name )
      return all[ x ];
  }

  if ( !optional )
    throw exUnsupportedCompressionMethod( name );

  return NULL;
}

const_sptr<CompressionMethod> CompressionMethod::findBySuffix( const std::string& fileName )
{
  std::vector< const_sptr<CompressionMethod> > const & all = getAll();

  for ( size_t x = 0; x < all.size(); ++x )
  {
    std::string suffix = all[ x ]->getFileSuffix();

    if ( fileName.size() > suffix.size() &&
         fileName.compare( fileName.size() - suffix.size(), suffix.size(),
                           suffix ) == 0 )
      return all[ x ];
  }

  return NULL;
}

enum
{
  BufferSize = 65536
};

void processFile( EnDecoder & enDecoder, std::string const & inputFileName,
                  std::string const & outputFileName )
{
  File in( inputFileName, File::ReadOnly );
  File out( outputFileName, File::WriteOnly );

  std::vector< char > inBuf( BufferSize ), outBuf( BufferSize );
  bool eof = false;

  enDecoder.setInput( inBuf.data(), 0 );

  for ( ; ; )
  {
    if ( !enDecoder.getAvailableInput() && !eof )
    {
      size_t got = in.readSome( inBuf.data(), inBuf.size() );
      if ( !got )
        eof = true;
      enDecoder.setInput( inBuf.data(), got );
    }

    enDecoder.setOutput( outBuf.data(), outBuf.size() );

    bool done = enDecoder.process( eof );

    size_t produced = outBuf.size() - enDecoder.getAvailableOutput();
    out.write( outBuf.data(), produced );

    if ( done )
      break;
  }

  out.close();
}

}
